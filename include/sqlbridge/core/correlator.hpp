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
 * @file correlator.hpp
 * @brief Request/response correlation engine.
 *
 * @details
 * This header declares the `Correlator` class, the heart of the bridge. The worker answers
 * queries in whatever order it finishes them, interleaved on a single output stream; the
 * only thing tying a response to its request is the `msgId` the correlator assigned.
 *
 * **Responsibilities:**
 * 1. **Submit:** Allocate an identifier, record the pending request, build its wire line.
 * 2. **Resolve:** Match a response to its pending request and fire the continuation once.
 * 3. **Broadcast:** Fail every pending request at once on a channel-wide fault.
 *
 * The correlator performs no I/O. The owner writes the lines it produces and feeds it the
 * lines the worker sends back.
 */

#pragma once

#include "sqlbridge/core/error.hpp"
#include "sqlbridge/core/pending_table.hpp"
#include "sqlbridge/infra/id_sequence.hpp"
#include "sqlbridge/protocol/codec.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sqlbridge::core {

/**
 * @struct CorrelatorOptions
 * @brief Diagnostic switches of the correlation engine.
 */
struct CorrelatorOptions {
    /// Emit one INFO timing line per resolved query.
    bool log_timing = false;

    /// Emit DEBUG traces (requests built, unknown identifiers dropped).
    bool logs = false;
};

/**
 * @struct Submission
 * @brief Result of preparing a query: its identifier and the line to write.
 */
struct Submission {
    std::uint64_t id = 0;
    std::string line; ///< One JSON frame, without the terminating `\n`.
};

/**
 * @class Correlator
 * @brief Owns the identifier sequence and the pending request table of one connection.
 *
 * @details
 * Continuations are always invoked after their record has left the table and with no
 * internal lock held, so a continuation may freely submit another query. An exception
 * escaping a continuation is logged and does not prevent delivery to other requests.
 */
class Correlator {
  public:
    explicit Correlator(CorrelatorOptions options = CorrelatorOptions());

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    /**
     * @brief Registers a query and builds its request line.
     *
     * The caller is responsible for the connection-state precondition and for writing
     * `Submission::line` to the worker.
     *
     * @param sql The query text.
     * @param completion The continuation, fired exactly once later.
     * @return Submission The allocated identifier and the encoded request.
     * @throws std::invalid_argument If `sql` contains a NUL character; nothing is registered.
     */
    Submission submit(const std::string& sql, QueryCallback completion);

    /**
     * @brief Delivers a decoded response to its pending request.
     *
     * **Resolution Steps:**
     * 1. Take the pending record (unknown identifiers are dropped).
     * 2. Unwrap a one-element `result` array to its single result-set.
     * 3. Log timing when enabled.
     * 4. Fire the continuation with a `QUERY_FAILURE` if the response carries `error`,
     *    otherwise without one. The payload is passed in both cases.
     *
     * @return true if a pending request was resolved.
     */
    bool resolve(protocol::ResponseEnvelope response);

    /**
     * @brief Decodes one worker output line and resolves it.
     * @return false if the line was malformed or its identifier is unknown.
     */
    bool dispatch_line(const std::string& line);

    /**
     * @brief Fails one pending request without a worker response.
     *
     * Used when the request line could not be written. A later response carrying the
     * same identifier is treated as unknown.
     *
     * @return true if the request was still pending.
     */
    bool abandon(std::uint64_t id, const BridgeError& error);

    /**
     * @brief Fails every pending request with the same error and empties the table.
     * @return std::size_t The number of continuations invoked.
     */
    std::size_t fail_all(const BridgeError& error);

    /**
     * @brief Empties the table without invoking anything.
     *
     * Lets a caller detach the requests of a session inside its own critical section and
     * fail them later with `fail()`, so requests registered in between are not affected.
     */
    std::vector<PendingRequest> drain();

    /// @brief Fails requests previously taken with `drain()`.
    std::size_t fail(std::vector<PendingRequest> drained, const BridgeError& error);

    /// @brief Number of requests awaiting a response.
    std::size_t pending() const;

    /// @brief Identifier assigned by the latest `submit`, 0 before the first one.
    std::uint64_t last_id() const;

    /**
     * @brief Formats the INFO line written per resolved query when `log_timing` is set.
     *
     * @code
     * Execution time (hr): 0s 42ms dbTime: 17ms dbSendTime: 3 sql=SELECT 1
     * @endcode
     *
     * Differences that would overflow are clamped to the `std::int64_t` range.
     *
     * @param elapsed Monotonic time since submission.
     * @param now_wall_ms Wall-clock epoch milliseconds at resolution.
     */
    static std::string timing_line(const PendingRequest& request,
                                   const protocol::ResponseEnvelope& response,
                                   std::chrono::steady_clock::duration elapsed,
                                   std::int64_t now_wall_ms);

  private:
    void log_timing(const PendingRequest& request,
                    const protocol::ResponseEnvelope& response) const;

    static void deliver(PendingRequest& request, std::optional<BridgeError> error,
                        protocol::Document result);

    CorrelatorOptions options_;
    infra::IdSequence ids_;
    PendingTable table_;
};

} // namespace sqlbridge::core
