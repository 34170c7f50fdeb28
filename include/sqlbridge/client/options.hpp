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
 * @file options.hpp
 * @brief Configuration of a bridge instance.
 */

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace sqlbridge::client {

/**
 * @struct BridgeOptions
 * @brief Everything a bridge needs to start and talk to its worker.
 *
 * @details
 * Connection parameters are opaque to the bridge: they are forwarded to the worker as
 * positional arguments and interpreted only there. The worker is launched as
 *
 * `<launcher> <launcher_args...> <worker_path> <host> <port> <database> <username> <password>`
 *
 * which, with the defaults, is `java -jar JavaSybaseLink/JavaSybaseLink.jar ...`.
 */
struct BridgeOptions {
    std::string host = "localhost";
    int port = 5000;
    std::string database;
    std::string username;
    std::string password;

    /// Path of the worker artifact handed to the launcher.
    std::string worker_path = "JavaSybaseLink/JavaSybaseLink.jar";

    /// Program that runs the worker artifact, resolved through `PATH`.
    std::string launcher = "java";

    /// Arguments placed between the launcher and the worker path.
    std::vector<std::string> launcher_args = {"-jar"};

    /// Encoding of the worker's output: `utf8` (default) or `latin1`.
    std::string encoding = "utf8";

    /// Log one timing line per resolved query.
    bool log_timing = false;

    /// Log request/response traces and session transitions.
    bool logs = false;

    /// Drop to `DISCONNECTED` (and stop the worker) when the worker writes to stderr while
    /// connected. Off by default: pending requests are failed and the connection stays up.
    bool disconnect_on_channel_fault = false;

    /// Time granted to the worker between `SIGTERM` and `SIGKILL`.
    std::chrono::milliseconds terminate_grace{2000};

    /**
     * @brief Checks the options for values the bridge cannot work with.
     * @throws std::invalid_argument Naming the offending option.
     */
    void validate() const;

    /// @brief The full worker command line, launcher first.
    std::vector<std::string> command_line() const;
};

} // namespace sqlbridge::client
