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
 * @file line_decoder.cpp
 * @brief Implementation of the incremental line splitter.
 */

#include "sqlbridge/protocol/line_decoder.hpp"

namespace sqlbridge::protocol {

namespace {

void strip_carriage_return(std::string& line)
{
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // namespace

/**
 * @details
 * The buffered tail never holds a `\n`, so only the bytes of the new chunk are scanned.
 * A long line arriving in many small reads therefore costs linear time overall.
 */
std::vector<std::string> LineDecoder::feed(const std::string& chunk)
{
    std::vector<std::string> lines;

    std::size_t start = 0;
    std::size_t pos = buffer_.size();
    buffer_ += chunk;

    while ((pos = buffer_.find('\n', pos)) != std::string::npos) {
        std::string line = buffer_.substr(start, pos - start);
        strip_carriage_return(line);
        lines.push_back(std::move(line));
        start = pos + 1;
        pos = start;
    }

    // Keep only the unterminated tail.
    if (start > 0) {
        buffer_.erase(0, start);
    }
    return lines;
}

bool LineDecoder::finish(std::string& line)
{
    if (buffer_.empty()) {
        return false;
    }

    line = std::move(buffer_);
    buffer_.clear();
    strip_carriage_return(line);
    return !line.empty();
}

} // namespace sqlbridge::protocol
