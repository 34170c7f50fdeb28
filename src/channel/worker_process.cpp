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
 * @file worker_process.cpp
 * @brief Implementation of the child-process worker channel.
 *
 * @details
 * This file handles the raw POSIX process API: `pipe2`, `fork`, `dup2`, `execvp`, `kill`
 * and `waitpid`. All parent-side descriptors are created with `O_CLOEXEC` so that a second
 * worker spawned by the same host does not inherit them and keep the first worker's pipes
 * open.
 */

#include "sqlbridge/channel/worker_process.hpp"

#include "sqlbridge/core/error.hpp"
#include "sqlbridge/infra/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sqlbridge::channel {

namespace {

/// Read size of the stream drain loops.
constexpr std::size_t kReadChunk = 4096;

/// How often a writer waiting on a full stdin pipe rechecks for shutdown.
constexpr int kWritePollMs = 50;

void close_fd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(int (&fds)[2])
{
    close_fd(fds[0]);
    close_fd(fds[1]);
}

core::BridgeError spawn_error(const std::string& what, int err)
{
    return core::BridgeError(core::ErrorKind::SPAWN_FAILURE,
                             what + ": " + std::string(std::strerror(err)));
}

} // namespace

WorkerProcess::WorkerProcess(std::vector<std::string> argv, std::chrono::milliseconds grace)
    : argv_(std::move(argv)), grace_(grace), pid_(-1), stdin_fd_(-1), stdout_fd_(-1),
      stderr_fd_(-1), running_(false), stopping_(false)
{
}

WorkerProcess::~WorkerProcess()
{
    terminate();
}

/**
 * @brief Spawns the worker.
 *
 * Operational Logic:
 * 1. **Pipes**: stdin, stdout, stderr and an exec-status pipe, all close-on-exec.
 * 2. **Fork**: The child redirects its standard streams and `execvp`s the worker. On
 *    failure it writes `errno` to the status pipe and exits with 127.
 * 3. **Confirm**: The parent reads the status pipe. EOF means `execvp` succeeded (the
 *    descriptor was closed by exec); an integer means it failed.
 * 4. **Drain**: Reader threads start only once the worker is known to be running.
 */
void WorkerProcess::open(ChannelEvents events)
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (argv_.empty() || argv_.front().empty()) {
        throw core::BridgeError(core::ErrorKind::SPAWN_FAILURE, "Worker command line is empty");
    }
    if (pid_ > 0) {
        throw core::BridgeError(core::ErrorKind::SPAWN_FAILURE,
                                "Worker process already started (pid " + std::to_string(pid_) +
                                    ")");
    }

    events_ = std::move(events);

    // A worker that dies while we write its stdin must surface as EPIPE, not kill the host.
    std::signal(SIGPIPE, SIG_IGN);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (::pipe2(in_pipe, O_CLOEXEC) < 0 || ::pipe2(out_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) < 0 || ::pipe2(status_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        throw spawn_error("Failed to create worker pipes", err);
    }

    // Build argv before forking: the child must not allocate.
    std::vector<char*> child_argv;
    child_argv.reserve(argv_.size() + 1);
    for (const std::string& arg : argv_) {
        child_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    child_argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(status_pipe);
        throw spawn_error("fork() failed", err);
    }

    if (pid == 0) {
        // --- Child process ---
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        std::signal(SIGPIPE, SIG_DFL);

        ::execvp(child_argv[0], child_argv.data());

        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // --- Parent process ---
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(status_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        throw spawn_error("Failed to start worker '" + argv_.front() + "'", exec_errno);
    }

    // A worker that stops reading must not pin a writer inside write(2).
    int flags = ::fcntl(in_pipe[1], F_GETFL);
    if (flags < 0 || ::fcntl(in_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
        int err = errno;
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        throw spawn_error("Failed to configure worker stdin", err);
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    running_ = true;

    infra::Logger::log(infra::LogLevel::DEBUG, "WorkerProcess: Spawned '" + argv_.front() +
                                                   "' (pid " + std::to_string(pid_) + ")");

    stdout_thread_ = std::thread([this] { read_loop(stdout_fd_, true); });
    stderr_thread_ = std::thread([this] { read_loop(stderr_fd_, false); });
}

/**
 * @brief Drains one stream until EOF.
 *
 * Blocking reads: the loop ends when the child closes its end, which happens at the
 * latest when the child exits.
 */
void WorkerProcess::read_loop(int fd, bool is_stdout)
{
    char buffer[kReadChunk];

    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            std::string chunk(buffer, static_cast<std::size_t>(n));
            if (is_stdout) {
                if (events_.on_stdout) {
                    events_.on_stdout(std::move(chunk));
                }
            } else if (events_.on_stderr) {
                events_.on_stderr(std::move(chunk));
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }

    if (is_stdout && events_.on_closed) {
        events_.on_closed();
    }
}

/**
 * @details
 * stdin is non-blocking. While the pipe is full the writer waits in `poll` for at most
 * `kWritePollMs` at a time and gives up once `terminate()` has begun, so a worker that
 * stopped reading can always be shut down.
 */
bool WorkerProcess::write_line(const std::string& line)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (stdin_fd_ < 0 || stopping_) {
        return false;
    }

    std::string frame = line;
    frame += '\n';

    const char* data = frame.data();
    std::size_t remaining = frame.size();

    // Handle partial writes; a frame larger than PIPE_BUF is split by the kernel.
    while (remaining > 0) {
        ssize_t written = ::write(stdin_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (stopping_) {
                    infra::Logger::log(infra::LogLevel::WARN,
                                       "WorkerProcess: Write abandoned, worker is shutting down");
                    return false;
                }
                pollfd pfd{stdin_fd_, POLLOUT, 0};
                int ready = ::poll(&pfd, 1, kWritePollMs);
                if (ready < 0 && errno != EINTR) {
                    infra::Logger::log(infra::LogLevel::ERROR,
                                       "WorkerProcess: poll() on worker stdin failed: " +
                                           std::string(std::strerror(errno)));
                    return false;
                }
                continue;
            }
            infra::Logger::log(infra::LogLevel::ERROR,
                               "WorkerProcess: Write to worker stdin failed: " +
                                   std::string(std::strerror(errno)));
            return false;
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }
    return true;
}

void WorkerProcess::terminate()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    // A writer parked on a full pipe sees this within one poll interval and releases stdin.
    stopping_ = true;

    // Closing stdin first lets a well-behaved worker exit on EOF.
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        close_fd(stdin_fd_);
    }

    if (pid_ > 0 && !exit_code()) {
        if (::kill(pid_, SIGTERM) == 0 && wait_for_exit(grace_)) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "WorkerProcess: Worker " + std::to_string(pid_) + " terminated");
        } else if (!exit_code()) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "WorkerProcess: Forcefully killing worker " +
                                   std::to_string(pid_));
            ::kill(pid_, SIGKILL);

            int status = 0;
            pid_t reaped;
            do {
                reaped = ::waitpid(pid_, &status, 0);
            } while (reaped < 0 && errno == EINTR);
            if (reaped == pid_) {
                record_status(status);
            }
        }
    }

    running_ = false;
    join_readers();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

bool WorkerProcess::is_alive() const
{
    return running_;
}

std::optional<int> WorkerProcess::exit_code() const
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    return exit_code_;
}

bool WorkerProcess::wait_for_exit(std::chrono::milliseconds timeout)
{
    auto start = std::chrono::steady_clock::now();

    while (true) {
        int status = 0;
        pid_t result = ::waitpid(pid_, &status, WNOHANG);

        if (result == pid_) {
            record_status(status);
            return true;
        }
        if (result < 0 && errno != EINTR) {
            // ECHILD: already reaped elsewhere.
            return true;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void WorkerProcess::record_status(int status)
{
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    }
}

void WorkerProcess::join_readers()
{
    for (std::thread* reader : {&stdout_thread_, &stderr_thread_}) {
        if (!reader->joinable()) {
            continue;
        }
        if (reader->get_id() == std::this_thread::get_id()) {
            reader->detach();
        } else {
            reader->join();
        }
    }
}

} // namespace sqlbridge::channel
