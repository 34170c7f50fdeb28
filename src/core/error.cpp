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

#include "sqlbridge/core/error.hpp"

namespace sqlbridge::core {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::SPAWN_FAILURE:
        return "SPAWN_FAILURE";
    case ErrorKind::HANDSHAKE_FAILURE:
        return "HANDSHAKE_FAILURE";
    case ErrorKind::WORKER_EXITED:
        return "WORKER_EXITED";
    case ErrorKind::NOT_CONNECTED:
        return "NOT_CONNECTED";
    case ErrorKind::QUERY_FAILURE:
        return "QUERY_FAILURE";
    case ErrorKind::CHANNEL_FAULT:
        return "CHANNEL_FAULT";
    case ErrorKind::DISCONNECTED:
        return "DISCONNECTED";
    case ErrorKind::INVALID_STATE:
        return "INVALID_STATE";
    }
    return "UNKNOWN";
}

} // namespace sqlbridge::core
