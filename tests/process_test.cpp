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
 * @file process_test.cpp
 * @brief End-to-end tests against a real child process (`fake_worker`).
 *
 * @details
 * Exercises `WorkerProcess` (fork/exec, pipes, reader threads, termination) and the full
 * bridge stack over real stdio. The helper's path is injected by the build as
 * `SQLBRIDGE_FAKE_WORKER_PATH`.
 */

#include "framework.hpp"
#include "sqlbridge/channel/worker_process.hpp"
#include "sqlbridge/client/bridge.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#ifndef SQLBRIDGE_FAKE_WORKER_PATH
#error "SQLBRIDGE_FAKE_WORKER_PATH must name the fake_worker executable"
#endif

using sqlbridge::client::Bridge;
using sqlbridge::client::BridgeOptions;
using sqlbridge::client::ConnectionState;
using sqlbridge::core::BridgeError;
using sqlbridge::core::ErrorKind;
using sqlbridge::protocol::Document;

namespace {

BridgeOptions worker_options(const std::string& mode)
{
    BridgeOptions options;
    options.launcher = SQLBRIDGE_FAKE_WORKER_PATH;
    options.launcher_args.clear();
    options.worker_path = mode;
    options.database = "master";
    options.username = "sa";
    options.password = "secret";
    options.terminate_grace = std::chrono::milliseconds(500);
    return options;
}

/// Waits (bounded) for a future and returns the error kind it failed with, if any.
template <typename T> std::optional<ErrorKind> failure_of(std::future<T>& future)
{
    ASSERT_TRUE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    try {
        future.get();
    } catch (const BridgeError& e) {
        return e.kind();
    }
    return std::nullopt;
}

template <typename T> T settle(std::future<T>& future)
{
    ASSERT_TRUE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    return future.get();
}

} // namespace

/**
 * @brief Handshake, a plain query and a multi-line query over real pipes.
 */
void test_process_query_round_trip()
{
    Bridge bridge(worker_options("echo"));

    std::future<std::string> connected = bridge.connect_async();
    ASSERT_EQ(settle(connected), std::string("connected"));

    std::future<Document> simple = bridge.query_async("SELECT 1");
    ASSERT_EQ(settle(simple).dump(), std::string("[{\"sql\":\"SELECT 1\"}]"));

    std::future<Document> multiline = bridge.query_async("SELECT *\nFROM t");
    ASSERT_EQ(settle(multiline).dump(), std::string("[{\"sql\":\"SELECT *\\nFROM t\"}]"));

    std::future<Document> multi = bridge.query_async("MULTI");
    Document result_sets = settle(multi);
    ASSERT_TRUE(result_sets.is_array());
    ASSERT_EQ(result_sets.size(), 2);
}

/**
 * @brief Answers released newest first still reach their own callers.
 */
void test_process_out_of_order_answers()
{
    Bridge bridge(worker_options("echo"));
    std::future<std::string> connected = bridge.connect_async();
    settle(connected);

    std::future<Document> first = bridge.query_async("HOLD first");
    std::future<Document> second = bridge.query_async("HOLD second");
    std::future<Document> flush = bridge.query_async("FLUSH");

    ASSERT_EQ(settle(first).dump(), std::string("[{\"sql\":\"HOLD first\"}]"));
    ASSERT_EQ(settle(second).dump(), std::string("[{\"sql\":\"HOLD second\"}]"));
    ASSERT_EQ(settle(flush).dump(), std::string("[{\"sql\":\"FLUSH\"}]"));
    ASSERT_EQ(bridge.pending(), static_cast<std::size_t>(0));
}

void test_process_query_failure()
{
    Bridge bridge(worker_options("echo"));
    std::future<std::string> connected = bridge.connect_async();
    settle(connected);

    std::future<Document> failing = bridge.query_async("FAIL");
    ASSERT_TRUE(failure_of(failing) == ErrorKind::QUERY_FAILURE);
    ASSERT_TRUE(bridge.is_connected());
}

/**
 * @brief Worker stderr while connected fails the pending query; the session survives.
 */
void test_process_channel_fault()
{
    Bridge bridge(worker_options("echo"));
    std::future<std::string> connected = bridge.connect_async();
    settle(connected);

    std::future<Document> faulted = bridge.query_async("STDERR");
    ASSERT_TRUE(failure_of(faulted) == ErrorKind::CHANNEL_FAULT);
    ASSERT_TRUE(bridge.is_connected());

    std::future<Document> after = bridge.query_async("SELECT 2");
    ASSERT_EQ(settle(after).dump(), std::string("[{\"sql\":\"SELECT 2\"}]"));
}

void test_process_handshake_rejected()
{
    Bridge bridge(worker_options("refuse"));
    std::future<std::string> connected = bridge.connect_async();
    ASSERT_TRUE(failure_of(connected) == ErrorKind::HANDSHAKE_FAILURE);
    ASSERT_TRUE(bridge.state() == ConnectionState::FAILED);
}

void test_process_login_error_on_stderr()
{
    Bridge bridge(worker_options("stderr"));
    std::future<std::string> connected = bridge.connect_async();
    ASSERT_TRUE(connected.wait_for(std::chrono::seconds(10)) == std::future_status::ready);

    bool matched = false;
    try {
        connected.get();
    } catch (const BridgeError& e) {
        matched = e.kind() == ErrorKind::HANDSHAKE_FAILURE &&
                  std::string(e.what()) == "Login failed for user 'sa'.";
    }
    ASSERT_TRUE(matched);
}

void test_process_exit_before_handshake()
{
    Bridge bridge(worker_options("exit"));
    std::future<std::string> connected = bridge.connect_async();
    ASSERT_TRUE(failure_of(connected) == ErrorKind::WORKER_EXITED);
}

/**
 * @brief A missing executable is reported before `connect` returns.
 */
void test_process_spawn_failure()
{
    BridgeOptions options = worker_options("echo");
    options.launcher = "/nonexistent/sqlbridge-worker";
    Bridge bridge(options);

    std::future<std::string> connected = bridge.connect_async();
    ASSERT_TRUE(connected.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    ASSERT_TRUE(failure_of(connected) == ErrorKind::SPAWN_FAILURE);
    ASSERT_TRUE(bridge.state() == ConnectionState::FAILED);
}

/**
 * @brief The worker exiting mid-session fails the in-flight query and disconnects.
 */
void test_process_worker_exit_while_connected()
{
    Bridge bridge(worker_options("echo"));
    std::future<std::string> connected = bridge.connect_async();
    settle(connected);

    std::future<Document> held = bridge.query_async("HOLD forever");
    std::future<Document> quit = bridge.query_async("QUIT");

    ASSERT_TRUE(failure_of(held) == ErrorKind::WORKER_EXITED);
    ASSERT_TRUE(failure_of(quit) == ErrorKind::WORKER_EXITED);
    ASSERT_TRUE(sqlbridge::test::eventually(
        [&] { return bridge.state() == ConnectionState::DISCONNECTED; }));
}

/**
 * @brief Direct channel use: stdout events, exit status and writes after termination.
 */
void test_worker_process_lifecycle()
{
    std::vector<std::string> argv{SQLBRIDGE_FAKE_WORKER_PATH, "echo"};
    sqlbridge::channel::WorkerProcess process(argv, std::chrono::milliseconds(500));

    std::atomic<bool> saw_handshake{false};
    std::atomic<bool> closed{false};
    std::mutex mutex;
    std::string output;

    sqlbridge::channel::ChannelEvents events;
    events.on_stdout = [&](std::string bytes) {
        std::lock_guard<std::mutex> lock(mutex);
        output += bytes;
        if (output.find("connected\n") != std::string::npos) {
            saw_handshake = true;
        }
    };
    events.on_closed = [&] { closed = true; };

    process.open(events);
    ASSERT_TRUE(process.is_alive());
    ASSERT_TRUE(process.pid() > 0);
    ASSERT_TRUE(sqlbridge::test::eventually([&] { return saw_handshake.load(); }));

    process.terminate();
    ASSERT_FALSE(process.is_alive());
    ASSERT_TRUE(closed.load());
    ASSERT_TRUE(process.exit_code().has_value());
    ASSERT_FALSE(process.write_line("{\"msgId\":1,\"sql\":\"SELECT 1\"}"));

    // Idempotent.
    process.terminate();
}

/**
 * @brief A worker that never reads stdin cannot stall shutdown behind a blocked write.
 */
void test_worker_process_terminate_unblocks_stalled_write()
{
    std::vector<std::string> argv{"/bin/sh", "-c", "echo connected; exec sleep 20"};
    sqlbridge::channel::WorkerProcess process(argv, std::chrono::milliseconds(500));
    process.open(sqlbridge::channel::ChannelEvents{});

    // Far larger than any pipe buffer, so the write cannot complete.
    std::string huge_sql(1024 * 1024, 'x');
    std::future<bool> writer = std::async(std::launch::async, [&] {
        return process.write_line("{\"msgId\":1,\"sql\":\"" + huge_sql + "\"}");
    });
    ASSERT_TRUE(writer.wait_for(std::chrono::milliseconds(200)) == std::future_status::timeout);

    auto start = std::chrono::steady_clock::now();
    process.terminate();
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));

    ASSERT_TRUE(writer.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    ASSERT_FALSE(writer.get());
    ASSERT_FALSE(process.is_alive());
}
