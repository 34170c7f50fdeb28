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
 * @file string.cpp
 * @brief Implementation of the wire text primitives.
 */

#include "sqlbridge/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace sqlbridge::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` is critical to prevent undefined
 * behavior with `std::isspace` when encountering bytes above 0x7F.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::escape_line_breaks(const std::string& s)
{
    std::string out;
    out.reserve(s.size());

    for (char c : s) {
        if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else {
            out += c;
        }
    }
    return out;
}

bool String::parse_encoding(const std::string& name, TextEncoding& out)
{
    std::string label = trim(name);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (label == "utf8" || label == "utf-8") {
        out = TextEncoding::UTF8;
        return true;
    }
    if (label == "latin1" || label == "iso-8859-1" || label == "binary") {
        out = TextEncoding::LATIN1;
        return true;
    }
    return false;
}

/**
 * @brief Converts a raw chunk to UTF-8.
 *
 * Latin-1 bytes below 0x80 are ASCII and copied as-is; bytes 0x80-0xFF become the
 * two-byte sequence `110000xx 10xxxxxx`.
 */
std::string String::to_utf8(const std::string& bytes, TextEncoding encoding)
{
    if (encoding == TextEncoding::UTF8) {
        return bytes;
    }

    std::string out;
    out.reserve(bytes.size() + bytes.size() / 4);

    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        if (b < 0x80) {
            out += static_cast<char>(b);
        } else {
            out += static_cast<char>(0xC0 | (b >> 6));
            out += static_cast<char>(0x80 | (b & 0x3F));
        }
    }
    return out;
}

} // namespace sqlbridge::infra
