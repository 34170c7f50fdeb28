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

#include "sqlbridge/client/options.hpp"

#include "sqlbridge/infra/string.hpp"

#include <stdexcept>

namespace sqlbridge::client {

void BridgeOptions::validate() const
{
    infra::TextEncoding ignored;
    if (!infra::String::parse_encoding(encoding, ignored)) {
        throw std::invalid_argument("Unsupported worker output encoding: '" + encoding + "'");
    }
    if (launcher.empty()) {
        throw std::invalid_argument("Worker launcher must not be empty");
    }
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("Port out of range: " + std::to_string(port));
    }
    if (terminate_grace.count() < 0) {
        throw std::invalid_argument("Terminate grace period must not be negative");
    }
}

std::vector<std::string> BridgeOptions::command_line() const
{
    std::vector<std::string> argv;
    argv.push_back(launcher);
    argv.insert(argv.end(), launcher_args.begin(), launcher_args.end());
    argv.push_back(worker_path);
    argv.push_back(host);
    argv.push_back(std::to_string(port));
    argv.push_back(database);
    argv.push_back(username);
    argv.push_back(password);
    return argv;
}

} // namespace sqlbridge::client
