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
 * @file correlator.cpp
 * @brief Implementation of the request/response correlation engine.
 */

#include "sqlbridge/core/correlator.hpp"

#include "sqlbridge/infra/logger.hpp"

#include <chrono>
#include <exception>
#include <limits>

namespace sqlbridge::core {

namespace {

std::int64_t wall_clock_ms()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// `a - b`, clamped to the range of `std::int64_t`.
std::int64_t saturating_difference(std::int64_t a, std::int64_t b)
{
    constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
    constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();

    if (b > 0 && a < kMin + b) {
        return kMin;
    }
    if (b < 0 && a > kMax + b) {
        return kMax;
    }
    return a - b;
}

} // namespace

Correlator::Correlator(CorrelatorOptions options) : options_(options) {}

/**
 * @details
 * The record is inserted before the line is handed back, so a response can never
 * arrive for an identifier the table does not know yet.
 */
Submission Correlator::submit(const std::string& sql, QueryCallback completion)
{
    PendingRequest request;
    request.id = ids_.next();
    request.sql = sql;
    request.submitted_wall_ms = wall_clock_ms();
    request.submitted_at = std::chrono::steady_clock::now();
    request.completion = std::move(completion);

    protocol::RequestEnvelope envelope{request.id, sql, request.submitted_wall_ms};

    Submission submission;
    submission.id = request.id;
    submission.line = protocol::Codec::encode(envelope);

    table_.insert(std::move(request));

    if (options_.logs) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Correlator: Request " + std::to_string(submission.id) +
                               " registered (pending: " + std::to_string(table_.size()) + ")");
    }
    return submission;
}

bool Correlator::resolve(protocol::ResponseEnvelope response)
{
    // 1. Take first: the record is gone before any user code runs.
    std::optional<PendingRequest> request = table_.take(response.msg_id);
    if (!request) {
        if (options_.logs) {
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Correlator: Dropping response for unknown msgId " +
                                   std::to_string(response.msg_id));
        }
        return false;
    }

    // 2. Single-statement queries get the bare result-set.
    protocol::Document payload = std::move(response.result);
    if (payload.is_array() && payload.size() == 1) {
        payload = payload.take_item(0);
    }

    // 3. Diagnostics only; never returned to the caller.
    if (options_.log_timing) {
        log_timing(*request, response);
    }

    // 4. Per-query failure or success. A failed query still hands over whatever
    //    `result` the worker sent alongside the error.
    if (response.error) {
        deliver(*request, BridgeError(ErrorKind::QUERY_FAILURE, *response.error),
                std::move(payload));
    } else {
        deliver(*request, std::nullopt, std::move(payload));
    }
    return true;
}

bool Correlator::dispatch_line(const std::string& line)
{
    std::optional<protocol::ResponseEnvelope> response = protocol::Codec::decode(line);
    if (!response) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Correlator: Ignoring unrecognized worker output: " + line);
        return false;
    }
    return resolve(std::move(*response));
}

bool Correlator::abandon(std::uint64_t id, const BridgeError& error)
{
    std::optional<PendingRequest> request = table_.take(id);
    if (!request) {
        return false;
    }

    deliver(*request, error, protocol::Document());
    return true;
}

/**
 * @details
 * The table is emptied in one step before the first continuation runs, so a
 * continuation that submits a new query does not see (or get) the broadcast failure.
 */
std::size_t Correlator::fail_all(const BridgeError& error)
{
    return fail(drain(), error);
}

std::vector<PendingRequest> Correlator::drain()
{
    return table_.take_all();
}

std::size_t Correlator::fail(std::vector<PendingRequest> drained, const BridgeError& error)
{
    for (PendingRequest& request : drained) {
        deliver(request, error, protocol::Document());
    }

    if (!drained.empty()) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Correlator: Failed " + std::to_string(drained.size()) +
                               " pending request(s): " + error.what());
    }
    return drained.size();
}

std::size_t Correlator::pending() const
{
    return table_.size();
}

std::uint64_t Correlator::last_id() const
{
    return ids_.last();
}

/**
 * @brief Builds the per-query timing line.
 *
 * - **hr**: monotonic time since submission (end-to-end latency).
 * - **dbTime**: worker-reported execution time (`javaEndTime - javaStartTime`).
 * - **dbSendTime**: wall clock now minus `javaEndTime` (transport latency back to us).
 */
std::string Correlator::timing_line(const PendingRequest& request,
                                    const protocol::ResponseEnvelope& response,
                                    std::chrono::steady_clock::duration elapsed,
                                    std::int64_t now_wall_ms)
{
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed - seconds);

    std::int64_t db_time =
        saturating_difference(response.worker_end_time, response.worker_start_time);
    std::int64_t send_time = saturating_difference(now_wall_ms, response.worker_end_time);

    return "Execution time (hr): " + std::to_string(seconds.count()) + "s " +
           std::to_string(millis.count()) + "ms dbTime: " + std::to_string(db_time) +
           "ms dbSendTime: " + std::to_string(send_time) + " sql=" + request.sql;
}

void Correlator::log_timing(const PendingRequest& request,
                            const protocol::ResponseEnvelope& response) const
{
    infra::Logger::log(infra::LogLevel::INFO,
                       timing_line(request, response,
                                   std::chrono::steady_clock::now() - request.submitted_at,
                                   wall_clock_ms()));
}

void Correlator::deliver(PendingRequest& request, std::optional<BridgeError> error,
                         protocol::Document result)
{
    if (!request.completion) {
        return;
    }

    try {
        request.completion(std::move(error), std::move(result));
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Correlator: Continuation of request " + std::to_string(request.id) +
                               " threw: " + e.what());
    }
}

} // namespace sqlbridge::core
