/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file worker_process.hpp
 * @brief Child-process implementation of the worker channel (POSIX).
 *
 * @details
 * This header declares the `WorkerProcess` class, which spawns the worker with its three
 * standard streams redirected through pipes and drains stdout and stderr on two dedicated
 * reader threads.
 */

#pragma once

#include "sqlbridge/channel/channel.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace sqlbridge::channel {

/**
 * @class WorkerProcess
 * @brief Owns one worker child process and its pipes.
 *
 * @details
 * **Lifecycle:**
 * 1. **Spawn:** `open()` forks and `execvp`s `argv[0]`. A close-on-exec status pipe carries
 *    an `execvp` failure back to the parent, so a missing executable is reported by `open()`
 *    itself instead of surfacing later as a silent exit.
 * 2. **Drain:** Reader threads forward stdout and stderr chunks to the event sinks. Writes
 *    to the non-blocking stdin wait for pipe space but never past the start of shutdown.
 * 3. **Shutdown:** `terminate()` closes stdin, sends `SIGTERM`, waits up to the grace period,
 *    escalates to `SIGKILL`, reaps the child and joins the readers.
 */
class WorkerProcess : public Channel {
  public:
    /**
     * @param argv The worker command line; `argv[0]` is resolved through `PATH`.
     * @param grace How long to wait for a graceful exit after `SIGTERM`.
     */
    WorkerProcess(std::vector<std::string> argv, std::chrono::milliseconds grace);

    /// Terminates the worker if it is still running.
    ~WorkerProcess() override;

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    void open(ChannelEvents events) override;
    bool write_line(const std::string& line) override;
    void terminate() override;
    bool is_alive() const override;

    /// @brief The child's process id, or -1 before `open`.
    pid_t pid() const
    {
        return pid_;
    }

    /// @brief Exit status once reaped (`128 + signal` for signal deaths).
    std::optional<int> exit_code() const;

  private:
    void read_loop(int fd, bool is_stdout);
    bool wait_for_exit(std::chrono::milliseconds timeout);
    void record_status(int status);
    void join_readers();

    std::vector<std::string> argv_;
    std::chrono::milliseconds grace_;
    ChannelEvents events_;

    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    int stderr_fd_;

    std::thread stdout_thread_;
    std::thread stderr_thread_;

    /// @brief Serializes writes to stdin and its closure.
    std::mutex write_mutex_;

    /// @brief Serializes `terminate()` calls.
    std::mutex lifecycle_mutex_;

    mutable std::mutex status_mutex_;
    std::optional<int> exit_code_;

    std::atomic<bool> running_;

    /// @brief Set once `terminate()` starts; pending writes give up.
    std::atomic<bool> stopping_;
};

} // namespace sqlbridge::channel
