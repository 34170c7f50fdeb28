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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (IdSequence, String, Dispatcher).
 *
 * @details
 * Request identifiers must be unique and increasing for the lifetime of a bridge, and the
 * dispatcher must preserve arrival order, since correlation and the handshake rely on both.
 */

#include "framework.hpp"
#include "sqlbridge/infra/dispatcher.hpp"
#include "sqlbridge/infra/id_sequence.hpp"
#include "sqlbridge/infra/string.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using sqlbridge::infra::String;
using sqlbridge::infra::TextEncoding;

/**
 * @brief The first identifier is 1 and each call adds exactly one.
 */
void test_id_sequence_starts_at_one()
{
    sqlbridge::infra::IdSequence ids;
    ASSERT_EQ(ids.last(), static_cast<std::uint64_t>(0));
    ASSERT_EQ(ids.next(), static_cast<std::uint64_t>(1));
    ASSERT_EQ(ids.next(), static_cast<std::uint64_t>(2));
    ASSERT_EQ(ids.last(), static_cast<std::uint64_t>(2));
}

/**
 * @brief Concurrent allocation never hands out the same identifier twice.
 */
void test_id_sequence_concurrent_uniqueness()
{
    sqlbridge::infra::IdSequence ids;
    std::mutex mutex;
    std::set<std::uint64_t> seen;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 250; ++i) {
                std::uint64_t id = ids.next();
                std::lock_guard<std::mutex> lock(mutex);
                seen.insert(id);
            }
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    ASSERT_EQ(seen.size(), static_cast<std::size_t>(1000));
    ASSERT_EQ(*seen.begin(), static_cast<std::uint64_t>(1));
    ASSERT_EQ(*seen.rbegin(), static_cast<std::uint64_t>(1000));
}

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 *
 * Scenarios verified:
 * - Elimination of leading/trailing space characters.
 * - Integrity of internal whitespace.
 */
void test_string_trim()
{
    ASSERT_EQ(String::trim("   connected \r"), std::string("connected"));
    ASSERT_EQ(String::trim("  SELECT 1  FROM t "), std::string("SELECT 1  FROM t"));
}

void test_string_trim_empty()
{
    ASSERT_TRUE(String::trim("  \t\n  \r ").empty());
    ASSERT_TRUE(String::trim("").empty());
}

/**
 * @brief Embedded line breaks must not survive into a wire frame.
 */
void test_escape_line_breaks()
{
    std::string escaped = String::escape_line_breaks("SELECT *\r\nFROM t\nWHERE 1");
    ASSERT_EQ(escaped, std::string("SELECT *\\r\\nFROM t\\nWHERE 1"));
    ASSERT_EQ(escaped.find('\n'), std::string::npos);
    ASSERT_EQ(escaped.find('\r'), std::string::npos);
}

void test_parse_encoding()
{
    TextEncoding encoding = TextEncoding::LATIN1;
    ASSERT_TRUE(String::parse_encoding("UTF-8", encoding));
    ASSERT_TRUE(encoding == TextEncoding::UTF8);

    ASSERT_TRUE(String::parse_encoding(" latin1 ", encoding));
    ASSERT_TRUE(encoding == TextEncoding::LATIN1);

    ASSERT_TRUE(String::parse_encoding("iso-8859-1", encoding));
    ASSERT_FALSE(String::parse_encoding("ebcdic", encoding));
}

/**
 * @brief Latin-1 bytes above 0x7F become two-byte UTF-8 sequences.
 */
void test_latin1_to_utf8()
{
    std::string raw = "caf";
    raw += static_cast<char>(0xE9);

    ASSERT_EQ(String::to_utf8(raw, TextEncoding::LATIN1), std::string("caf\xC3\xA9"));
    ASSERT_EQ(String::to_utf8(raw, TextEncoding::UTF8), raw);
}

/**
 * @brief Tasks posted from several producers run one at a time, each producer's in order.
 */
void test_dispatcher_preserves_order()
{
    sqlbridge::infra::Dispatcher dispatcher;
    std::vector<int> order;
    std::atomic<int> concurrent{0};
    std::atomic<bool> overlap{false};

    for (int i = 0; i < 100; ++i) {
        dispatcher.post([&, i] {
            if (++concurrent > 1) {
                overlap = true;
            }
            order.push_back(i);
            --concurrent;
        });
    }
    dispatcher.wait_idle();

    ASSERT_FALSE(overlap.load());
    ASSERT_EQ(order.size(), static_cast<std::size_t>(100));
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(order[static_cast<std::size_t>(i)], i);
    }
}

/**
 * @brief A throwing task is contained; later tasks still run.
 */
void test_dispatcher_survives_throwing_task()
{
    sqlbridge::infra::Dispatcher dispatcher;
    std::atomic<bool> ran{false};

    dispatcher.post([] { throw std::runtime_error("task failure"); });
    dispatcher.post([&] { ran = true; });
    dispatcher.wait_idle();

    ASSERT_TRUE(ran.load());
}

void test_dispatcher_rejects_after_stop()
{
    sqlbridge::infra::Dispatcher dispatcher;
    std::atomic<int> count{0};

    ASSERT_TRUE(dispatcher.post([&] { ++count; }));
    dispatcher.stop();

    ASSERT_EQ(count.load(), 1);
    ASSERT_FALSE(dispatcher.post([&] { ++count; }));
}
