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
 * @file channel.hpp
 * @brief Abstract byte channel to a worker.
 *
 * @details
 * The bridge never touches file descriptors directly. It talks to a `Channel`, which the
 * production build backs with a child process (`WorkerProcess`) and the test suite backs
 * with an in-memory double.
 */

#pragma once

#include <functional>
#include <string>

namespace sqlbridge::channel {

/**
 * @struct ChannelEvents
 * @brief Sinks through which a channel reports traffic.
 *
 * @details
 * Sinks may be invoked from channel-owned threads. They must not block and must not call
 * back into the channel; the bridge only re-posts them to its dispatcher.
 */
struct ChannelEvents {
    /// Bytes read from the worker's standard output.
    std::function<void(std::string bytes)> on_stdout;

    /// Bytes read from the worker's standard error.
    std::function<void(std::string bytes)> on_stderr;

    /// The worker's standard output reached end-of-file. Fired at most once.
    std::function<void()> on_closed;
};

/**
 * @class Channel
 * @brief Interface to one worker instance.
 */
class Channel {
  public:
    virtual ~Channel() = default;

    /**
     * @brief Starts the worker and begins delivering events.
     *
     * @param events The sinks; copied into the channel.
     * @throws core::BridgeError with `SPAWN_FAILURE` if the worker cannot be started.
     */
    virtual void open(ChannelEvents events) = 0;

    /**
     * @brief Writes `line` followed by a single `\n` to the worker's input.
     *
     * Concurrent calls never interleave their bytes.
     *
     * @return false if the worker's input is closed or the write failed.
     */
    virtual bool write_line(const std::string& line) = 0;

    /**
     * @brief Stops the worker and releases its streams. Idempotent.
     *
     * After `terminate()` returns, no further events are delivered.
     */
    virtual void terminate() = 0;

    /// @brief True between a successful `open` and `terminate` (or the worker's death).
    virtual bool is_alive() const = 0;
};

} // namespace sqlbridge::channel
