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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for SQLBridge.
 *
 * @details
 * This header declares the `Logger` class, the single reporting interface used by the
 * bridge, the worker channel and the shell. Output from the caller's thread, the reader
 * threads and the dispatcher thread is serialized so that lines never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace sqlbridge::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Byte-level traffic with the worker.
    DEBUG, ///< Request/response bookkeeping and session transitions.
    INFO,  ///< Nominal events (worker spawned, handshake completed, timing lines).
    WARN,  ///< Anomalies that do not fail a request (malformed worker output).
    ERROR, ///< Failures surfaced to a caller (channel faults, spawn errors).
    FATAL  ///< Failures that end the process.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are discarded before the lock is taken.
 * The minimum level defaults to `INFO`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * sqlbridge::infra::Logger::log(LogLevel::INFO, "Bridge: Worker handshake completed.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     * @param level Messages strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /// @brief Returns true when a message of the given severity would be written.
    static bool enabled(LogLevel level);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum severity; read without the lock on the hot path.
    static std::atomic<LogLevel> min_level_;
};

} // namespace sqlbridge::infra
