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
 * @file document.cpp
 * @brief Implementation of the cJSON ownership wrapper.
 */

#include "sqlbridge/protocol/document.hpp"

#include <cstdlib>

namespace sqlbridge::protocol {

Document Document::parse(const std::string& text)
{
    return Document(cJSON_Parse(text.c_str()));
}

Document Document::copy_of(const cJSON* node)
{
    if (!node) {
        return Document();
    }
    return Document(cJSON_Duplicate(node, 1));
}

bool Document::is_array() const
{
    return root_ && cJSON_IsArray(root_);
}

bool Document::is_object() const
{
    return root_ && cJSON_IsObject(root_);
}

bool Document::is_null() const
{
    return !root_ || cJSON_IsNull(root_);
}

int Document::size() const
{
    if (is_array() || is_object()) {
        return cJSON_GetArraySize(root_);
    }
    return 0;
}

const cJSON* Document::at(int index) const
{
    if (!is_array() || index < 0) {
        return nullptr;
    }
    return cJSON_GetArrayItem(root_, index);
}

const cJSON* Document::field(const char* key) const
{
    if (!is_object()) {
        return nullptr;
    }
    return cJSON_GetObjectItemCaseSensitive(root_, key);
}

Document Document::take_field(const char* key)
{
    if (!is_object()) {
        return Document();
    }
    return Document(cJSON_DetachItemFromObjectCaseSensitive(root_, key));
}

Document Document::take_item(int index)
{
    if (!is_array() || index < 0 || index >= size()) {
        return Document();
    }
    return Document(cJSON_DetachItemFromArray(root_, index));
}

/**
 * @details
 * `cJSON_PrintUnformatted` returns a malloc'd buffer; it is copied into the result and
 * released with `cJSON_free` before returning.
 */
std::string Document::dump() const
{
    if (!root_) {
        return "null";
    }

    char* raw = cJSON_PrintUnformatted(root_);
    if (!raw) {
        return "null";
    }

    std::string text(raw);
    cJSON_free(raw);
    return text;
}

} // namespace sqlbridge::protocol
