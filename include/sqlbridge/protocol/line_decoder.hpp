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
 * @file line_decoder.hpp
 * @brief Reassembles newline-delimited frames from arbitrary byte chunks.
 *
 * @details
 * Pipe reads return whatever the kernel has buffered: half a frame, several frames, or a
 * frame split across two reads. `LineDecoder` restores the framing so that the layers above
 * only ever see whole lines, in arrival order.
 */

#pragma once

#include <string>
#include <vector>

namespace sqlbridge::protocol {

/**
 * @class LineDecoder
 * @brief Incremental `\n` splitter.
 *
 * @details
 * A trailing `\r` is stripped from every line so that workers writing CRLF are accepted.
 * Empty lines are returned as-is; callers decide whether they matter.
 * Not thread-safe; owned by the single consumer of one worker's output.
 */
class LineDecoder {
  public:
    /**
     * @brief Appends a chunk and extracts every line it completes.
     *
     * @param chunk Raw bytes, already converted to UTF-8.
     * @return std::vector<std::string> Complete lines without their terminators.
     */
    std::vector<std::string> feed(const std::string& chunk);

    /**
     * @brief Flushes the unterminated tail at end of stream.
     *
     * @param line Receives the tail when there is one.
     * @return true if a non-empty tail was pending.
     */
    bool finish(std::string& line);

    /// @brief Bytes received but not yet terminated by `\n`.
    std::size_t buffered() const
    {
        return buffer_.size();
    }

  private:
    std::string buffer_;
};

} // namespace sqlbridge::protocol
