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
 * @file error.hpp
 * @brief Failure taxonomy of the bridge.
 *
 * @details
 * Every failure the bridge reports to a caller is a `BridgeError`. It is delivered through
 * the same channel the caller used: as the first argument of a callback, or as the
 * exception stored in a `std::future`.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sqlbridge::core {

/**
 * @enum ErrorKind
 * @brief Classifies where in the connection or request lifecycle a failure happened.
 */
enum class ErrorKind {
    SPAWN_FAILURE,     ///< The worker executable could not be started.
    HANDSHAKE_FAILURE, ///< The worker started but did not announce `connected`.
    WORKER_EXITED,     ///< The worker's output closed (process died).
    NOT_CONNECTED,     ///< A query was submitted outside the connected state.
    QUERY_FAILURE,     ///< The worker answered this query with an `error`.
    CHANNEL_FAULT,     ///< The worker wrote to stderr, or the request could not be written.
    DISCONNECTED,      ///< The connection was closed while the request was in flight.
    INVALID_STATE      ///< `connect` was called while already connecting or connected.
};

/// @brief Stable upper-case name of an error kind, for logs and diagnostics.
const char* to_string(ErrorKind kind);

/**
 * @class BridgeError
 * @brief The exception type carried by every bridge failure.
 */
class BridgeError : public std::runtime_error {
  public:
    BridgeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

} // namespace sqlbridge::core
