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
 * @file pending_table.hpp
 * @brief Registry of in-flight queries keyed by request identifier.
 *
 * @details
 * This header declares `PendingRequest`, the record kept for every query between the moment
 * its line is written to the worker and the moment its continuation fires, and
 * `PendingTable`, the map that owns those records.
 *
 * The table hands records out by *taking* them: a record leaves the table in the same
 * critical section in which it is found. Whoever takes a record is the only party that can
 * ever invoke its continuation, which is what makes delivery exactly-once.
 */

#pragma once

#include "sqlbridge/core/error.hpp"
#include "sqlbridge/protocol/document.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlbridge::core {

/**
 * @brief Continuation of a query.
 *
 * Invoked exactly once: with `error` empty and the result payload on success, or with
 * `error` set on failure. A failed query carries the worker's `result` when the worker sent
 * one alongside its error; bridge-side failures carry an empty Document.
 */
using QueryCallback =
    std::function<void(std::optional<BridgeError> error, protocol::Document result)>;

/**
 * @struct PendingRequest
 * @brief Metadata of one in-flight query.
 */
struct PendingRequest {
    std::uint64_t id = 0;

    /// Kept for timing diagnostics only.
    std::string sql;

    /// Wall-clock submission time, epoch milliseconds (also sent as `sentTime`).
    std::int64_t submitted_wall_ms = 0;

    /// Monotonic submission time, immune to clock adjustments.
    std::chrono::steady_clock::time_point submitted_at;

    QueryCallback completion;
};

/**
 * @class PendingTable
 * @brief A mutex-guarded `id -> PendingRequest` map.
 *
 * @details
 * Insertion happens on the submitting thread; removal on the dispatcher thread or during
 * teardown. All operations are O(1) except `take_all`.
 */
class PendingTable {
  public:
    /**
     * @brief Registers a request.
     * @return false if a request with the same id is already pending (nothing is changed).
     */
    bool insert(PendingRequest request);

    /**
     * @brief Removes and returns the request with the given id.
     * @return std::optional<PendingRequest> The record, or `std::nullopt` if unknown.
     */
    std::optional<PendingRequest> take(std::uint64_t id);

    /**
     * @brief Removes and returns every pending request, leaving the table empty.
     *
     * Records are returned in ascending id order so that broadcast failures are delivered
     * in submission order.
     */
    std::vector<PendingRequest> take_all();

    bool contains(std::uint64_t id) const;

    std::size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, PendingRequest> entries_;
};

} // namespace sqlbridge::core
