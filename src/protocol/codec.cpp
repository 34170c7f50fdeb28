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
 * @file codec.cpp
 * @brief cJSON-backed implementation of the worker wire codec.
 *
 * @details
 * 1. **Encode**: Build a cJSON object, print it compactly, escape stray line breaks.
 * 2. **Decode**: Parse, validate the envelope members one by one, and move the `result`
 *    subtree out of the parsed message so the rest of the message can be freed.
 */

#include "sqlbridge/protocol/codec.hpp"

#include "sqlbridge/infra/string.hpp"

#include <cmath>
#include <stdexcept>

namespace sqlbridge::protocol {

namespace {

/// Largest integer a JSON number (IEEE double) carries exactly.
constexpr double kMaxExactInteger = 9007199254740992.0;

/// Out-of-range or non-finite values read as absent; the cast below is then always defined.
std::int64_t read_timestamp(const cJSON* root, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!cJSON_IsNumber(item)) {
        return 0;
    }

    double raw = item->valuedouble;
    if (!std::isfinite(raw) || raw > kMaxExactInteger || raw < -kMaxExactInteger) {
        return 0;
    }
    return static_cast<std::int64_t>(raw);
}

} // namespace

std::string Codec::encode(const RequestEnvelope& request)
{
    // cJSON strings are C strings; an embedded NUL would silently cut the statement short.
    if (request.sql.find('\0') != std::string::npos) {
        throw std::invalid_argument("SQL text of request " + std::to_string(request.msg_id) +
                                    " contains a NUL character");
    }

    cJSON* msg = cJSON_CreateObject();
    Document guard(msg);

    cJSON_AddNumberToObject(msg, "msgId", static_cast<double>(request.msg_id));
    cJSON_AddStringToObject(msg, "sql", request.sql.c_str());
    cJSON_AddNumberToObject(msg, "sentTime", static_cast<double>(request.sent_time));

    // cJSON already escapes control characters inside strings; the second pass guarantees
    // the one-frame-per-line invariant independently of the serializer.
    return infra::String::escape_line_breaks(guard.dump());
}

std::optional<ResponseEnvelope> Codec::decode(const std::string& line)
{
    Document msg = Document::parse(line);
    if (!msg.is_object()) {
        return std::nullopt;
    }

    const cJSON* id = msg.field("msgId");
    if (!cJSON_IsNumber(id)) {
        return std::nullopt;
    }

    double raw_id = id->valuedouble;
    if (raw_id < 1.0 || raw_id > kMaxExactInteger || std::floor(raw_id) != raw_id) {
        return std::nullopt;
    }

    ResponseEnvelope response;
    response.msg_id = static_cast<std::uint64_t>(raw_id);
    response.worker_start_time = read_timestamp(msg.get(), "javaStartTime");
    response.worker_end_time = read_timestamp(msg.get(), "javaEndTime");

    // Ownership Transfer: 'result' must survive the envelope's destruction.
    response.result = msg.take_field("result");

    const cJSON* error = msg.field("error");
    if (error && !cJSON_IsNull(error)) {
        if (cJSON_IsString(error) && error->valuestring) {
            response.error = std::string(error->valuestring);
        } else {
            response.error = Document::copy_of(error).dump();
        }
    }

    return response;
}

} // namespace sqlbridge::protocol
