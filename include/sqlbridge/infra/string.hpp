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
 * @file string.hpp
 * @brief Text primitives used on the worker wire.
 *
 * @details
 * This header defines the `String` utility class. It covers the handful of text operations
 * the bridge needs around the line protocol: trimming the handshake token, keeping a
 * serialized frame on a single line, and normalizing the worker's output encoding to UTF-8
 * before it reaches the JSON parser.
 */

#pragma once

#include <string>

namespace sqlbridge::infra {

/**
 * @enum TextEncoding
 * @brief Byte encodings accepted for the worker's output stream.
 */
enum class TextEncoding {
    UTF8,  ///< Passed through unchanged.
    LATIN1 ///< ISO-8859-1; every byte maps to the code point of the same value.
};

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * **Whitespace Definitions:** space, `\t`, `\n`, `\r`, `\v`, `\f`.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if `s` is all whitespace.
     *
     * @code
     * std::string token = sqlbridge::infra::String::trim("connected\r\n"); // "connected"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Replaces raw line breaks with their two-character JSON escapes.
     *
     * `\n` becomes `\\n` and `\r` becomes `\\r`. Applied to an already serialized JSON
     * frame, the result is still valid JSON and is guaranteed to occupy one wire line.
     *
     * @param s A serialized frame.
     * @return std::string The frame with no raw line-break characters.
     */
    static std::string escape_line_breaks(const std::string& s);

    /**
     * @brief Resolves an encoding label to a `TextEncoding`.
     *
     * Accepted labels (case-insensitive): `utf8`, `utf-8`, `latin1`, `iso-8859-1`, `binary`.
     *
     * @param name The label, typically taken from configuration.
     * @param out Receives the resolved encoding on success.
     * @return true if the label is recognized.
     */
    static bool parse_encoding(const std::string& name, TextEncoding& out);

    /**
     * @brief Converts a chunk of worker output to UTF-8.
     *
     * Latin-1 is single-byte, so chunks may be converted independently of how the
     * stream was split by `read(2)`.
     *
     * @param bytes The raw chunk.
     * @param encoding The encoding the worker writes in.
     * @return std::string The chunk as UTF-8.
     */
    static std::string to_utf8(const std::string& bytes, TextEncoding encoding);
};

} // namespace sqlbridge::infra
