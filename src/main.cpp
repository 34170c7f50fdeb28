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
 * @file main.cpp
 * @brief Shell Entry Point.
 *
 * @details
 * This file contains the `main` function of the `sqlbridge` shell:
 * 1. Argument Parsing.
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Worker Startup and Handshake.
 * 4. Read-Eval-Print Loop: one SQL statement per input line.
 */

#include "sqlbridge/client/bridge.hpp"
#include "sqlbridge/core/error.hpp"
#include "sqlbridge/infra/logger.hpp"
#include "sqlbridge/infra/string.hpp"

#include <atomic>
#include <chrono>
#include <signal.h>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

/// @brief Set by the signal handler; polled by the shell loop.
std::atomic<bool> g_interrupted{false};

/**
 * @brief System Signal Handler.
 *
 * Only raises a flag. Installed without `SA_RESTART` so that a blocking read of standard
 * input returns and the loop can observe it.
 */
void signal_handler(int)
{
    g_interrupted = true;
}

void install_signal_handlers()
{
    struct sigaction action {};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(SIGINT, &action, nullptr);  // Ctrl+C
    sigaction(SIGTERM, &action, nullptr); // Kill
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name
              << " HOST PORT DATABASE USERNAME PASSWORD [OPTIONS]\n"
              << "Reads one SQL statement per line from stdin and prints each result as JSON.\n"
              << "Options:\n"
              << "  --jar PATH       Worker jar (Default: JavaSybaseLink/JavaSybaseLink.jar)\n"
              << "  --launcher CMD   Program that runs the jar (Default: java)\n"
              << "  --encoding ENC   Worker output encoding: utf8 or latin1 (Default: utf8)\n"
              << "  --log-timing     Log the timing of every query\n"
              << "  --logs           Log protocol traffic and session transitions\n"
              << "  --help           Show this help message\n"
              << "Type \\q or send EOF to quit.\n";
}

/**
 * @brief Fills `options` from the command line.
 * @throws std::invalid_argument On a missing value, an unknown flag or a bad port.
 */
sqlbridge::client::BridgeOptions parse_arguments(int argc, char* argv[])
{
    sqlbridge::client::BridgeOptions options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto value = [&](const std::string& flag) {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + flag);
            }
            return std::string(argv[++i]);
        };

        if (arg == "--jar") {
            options.worker_path = value(arg);
        } else if (arg == "--launcher") {
            options.launcher = value(arg);
        } else if (arg == "--encoding") {
            options.encoding = value(arg);
        } else if (arg == "--log-timing") {
            options.log_timing = true;
        } else if (arg == "--logs") {
            options.logs = true;
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            throw std::invalid_argument("Unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 5) {
        throw std::invalid_argument("Expected HOST PORT DATABASE USERNAME PASSWORD, got " +
                                    std::to_string(positional.size()) + " arguments");
    }

    options.host = positional[0];
    options.port = std::stoi(positional[1]);
    options.database = positional[2];
    options.username = positional[3];
    options.password = positional[4];
    return options;
}

/**
 * @brief Waits for a future while watching the interrupt flag.
 *
 * An interrupt disconnects the bridge, which settles the future with `DISCONNECTED`.
 */
template <typename T> T await(sqlbridge::client::Bridge& bridge, std::future<T>& future)
{
    while (future.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted) {
            bridge.disconnect();
        }
    }
    return future.get();
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    using sqlbridge::infra::Logger;
    using sqlbridge::infra::LogLevel;

    // 0. Argument Pre-check
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--help") {
            print_help(argv[0]);
            return 0;
        }
    }

    // 1. Register Signal Handlers
    install_signal_handlers();

    int exit_code = 0;

    try {
        // 2. Parse Command Line Arguments
        sqlbridge::client::BridgeOptions options = parse_arguments(argc, argv);
        if (options.logs) {
            Logger::set_level(LogLevel::DEBUG);
        }

        Logger::log(LogLevel::INFO, "System: Starting SQLBridge Shell v1.0.0...");
        Logger::log(LogLevel::INFO, "Config: Worker '" + options.launcher + " " +
                                        options.worker_path + "' for " + options.host + ":" +
                                        std::to_string(options.port) + "/" +
                                        options.database);

        // 3. Start the worker and wait for its handshake
        sqlbridge::client::Bridge bridge(options);
        std::future<std::string> handshake = bridge.connect_async();
        std::string banner = await(bridge, handshake);
        Logger::log(LogLevel::INFO, "System: Worker " + banner + ". Ready for queries.");

        // 4. Read-Eval-Print Loop
        std::string line;
        while (!g_interrupted && std::getline(std::cin, line)) {
            std::string sql = sqlbridge::infra::String::trim(line);
            if (sql.empty()) {
                continue;
            }
            if (sql == "\\q") {
                break;
            }

            std::future<sqlbridge::protocol::Document> answer = bridge.query_async(sql);
            try {
                sqlbridge::protocol::Document result = await(bridge, answer);
                std::cout << result.dump() << std::endl;
            } catch (const sqlbridge::core::BridgeError& e) {
                std::cout << "ERROR (" << sqlbridge::core::to_string(e.kind())
                          << "): " << e.what() << std::endl;
            }

            if (!bridge.is_connected()) {
                if (!g_interrupted) {
                    Logger::log(LogLevel::ERROR, "System: Lost the worker connection.");
                    exit_code = 1;
                }
                break;
            }
        }

        if (g_interrupted) {
            Logger::log(LogLevel::WARN, "System: Interrupt received. Initiating shutdown...");
        }

        bridge.disconnect();

    } catch (const sqlbridge::core::BridgeError& e) {
        Logger::log(LogLevel::FATAL, "System: Worker unavailable (" +
                                         std::string(sqlbridge::core::to_string(e.kind())) +
                                         "): " + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    } catch (...) {
        Logger::log(LogLevel::FATAL, "System: Unknown unhandled exception occurred.");
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return exit_code;
}
