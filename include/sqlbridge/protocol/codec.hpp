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
 * @file codec.hpp
 * @brief Wire envelopes exchanged with the worker and their JSON codec.
 *
 * @details
 * The worker speaks one JSON object per line in each direction:
 *
 * - **Request** (bridge -> worker):
 *   `{"msgId": <int>, "sql": "<text>", "sentTime": <epoch-ms>}`
 * - **Response** (worker -> bridge):
 *   `{"msgId": <int>, "result": [<result-set>, ...], "javaStartTime": <epoch-ms>,
 *     "javaEndTime": <epoch-ms>, "error": "<text>"}` where `error` is optional.
 *
 * Worker output is untrusted. Decoding never throws: anything that cannot be matched to a
 * request is reported as "unrecognized" and left for the caller to drop.
 */

#pragma once

#include "sqlbridge/protocol/document.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sqlbridge::protocol {

/**
 * @struct RequestEnvelope
 * @brief One outbound query.
 */
struct RequestEnvelope {
    std::uint64_t msg_id = 0;
    std::string sql;
    std::int64_t sent_time = 0; ///< Wall-clock epoch milliseconds at submission.
};

/**
 * @struct ResponseEnvelope
 * @brief One inbound result (or per-query error) from the worker.
 */
struct ResponseEnvelope {
    std::uint64_t msg_id = 0;

    /// The `result` member as sent (normally an array); empty when absent.
    Document result;

    std::int64_t worker_start_time = 0; ///< `javaStartTime`, 0 when absent or beyond +/-2^53.
    std::int64_t worker_end_time = 0;   ///< `javaEndTime`, 0 when absent or beyond +/-2^53.

    /// Set when the worker reported a failure for this query.
    std::optional<std::string> error;
};

/**
 * @class Codec
 * @brief Stateless translation between envelopes and wire lines.
 */
class Codec {
  public:
    /**
     * @brief Serializes a request to a single wire line (without the terminating `\n`).
     *
     * Line breaks inside the SQL text are escaped, so the returned string never contains a
     * raw `\n` or `\r`.
     *
     * @param request The envelope to encode.
     * @return std::string Compact JSON text.
     * @throws std::invalid_argument If the SQL text contains a NUL character.
     *
     * @code
     * RequestEnvelope req{1, "SELECT 1\nFROM dual", 1700000000000};
     * std::string line = Codec::encode(req);
     * // {"msgId":1,"sql":"SELECT 1\nFROM dual","sentTime":1700000000000}
     * @endcode
     */
    static std::string encode(const RequestEnvelope& request);

    /**
     * @brief Parses one worker output line into a response.
     *
     * Rejected (returns `std::nullopt`):
     * - text that is not valid JSON, or whose root is not an object;
     * - a missing `msgId`, or one that is not a positive integer.
     *
     * A non-string `error` member is kept in its JSON form.
     *
     * @param line One line of worker output, UTF-8.
     * @return std::optional<ResponseEnvelope> The decoded envelope, if recognized.
     */
    static std::optional<ResponseEnvelope> decode(const std::string& line);
};

} // namespace sqlbridge::protocol
