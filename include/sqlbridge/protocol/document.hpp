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
 * @file document.hpp
 * @brief Owning RAII handle for cJSON trees.
 *
 * @details
 * Every query result travels from the worker to the caller as a cJSON tree. cJSON hands out
 * raw heap pointers that must be released with `cJSON_Delete`; `Document` pins that
 * obligation to a C++ object so that a result dropped on any path (an error, an unknown
 * `msgId`, a caller that ignores its future) is still freed exactly once.
 */

#pragma once

#include <cJSON.h>

#include <string>

namespace sqlbridge::protocol {

/**
 * @class Document
 * @brief A move-only owner of one cJSON root node.
 *
 * @details
 * A default-constructed Document is empty (`get() == nullptr`). Accessors never throw and
 * treat an empty Document like JSON `null`.
 */
class Document {
  public:
    /// Creates an empty document.
    Document() : root_(nullptr) {}

    /// Takes ownership of a tree returned by cJSON. `root` must not have a parent.
    explicit Document(cJSON* root) : root_(root) {}

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    Document(Document&& other) noexcept : root_(other.root_)
    {
        other.root_ = nullptr;
    }

    Document& operator=(Document&& other) noexcept
    {
        if (this != &other) {
            reset(other.root_);
            other.root_ = nullptr;
        }
        return *this;
    }

    /// Releases the owned tree back to cJSON.
    ~Document()
    {
        reset(nullptr);
    }

    /**
     * @brief Parses JSON text.
     *
     * @param text A JSON value in UTF-8.
     * @return Document The parsed tree, or an empty Document when `text` is not valid JSON.
     */
    static Document parse(const std::string& text);

    /// @brief Returns a deep copy of `node`, or an empty Document for `nullptr`.
    static Document copy_of(const cJSON* node);

    /// @brief Read-only access to the root node (may be `nullptr`).
    const cJSON* get() const
    {
        return root_;
    }

    /// @brief Gives up ownership; the caller becomes responsible for `cJSON_Delete`.
    cJSON* release()
    {
        cJSON* raw = root_;
        root_ = nullptr;
        return raw;
    }

    /// @brief Replaces the owned tree, deleting the previous one.
    void reset(cJSON* root)
    {
        if (root_) {
            cJSON_Delete(root_);
        }
        root_ = root;
    }

    bool empty() const
    {
        return root_ == nullptr;
    }

    bool is_array() const;
    bool is_object() const;

    /// @brief True for an empty Document and for an explicit JSON `null`.
    bool is_null() const;

    /// @brief Number of elements for arrays and objects, 0 otherwise.
    int size() const;

    /// @brief Element `index` of an array root, or `nullptr`.
    const cJSON* at(int index) const;

    /// @brief Member `key` of an object root (case-sensitive), or `nullptr`.
    const cJSON* field(const char* key) const;

    /**
     * @brief Detaches member `key` from an object root into its own Document.
     * @return Document The detached subtree, or an empty Document if there is no such member.
     */
    Document take_field(const char* key);

    /**
     * @brief Detaches element `index` from an array root into its own Document.
     * @return Document The detached element, or an empty Document if out of range.
     */
    Document take_item(int index);

    /**
     * @brief Serializes the tree to compact JSON.
     * @return std::string The JSON text; `null` for an empty Document.
     */
    std::string dump() const;

  private:
    cJSON* root_;
};

} // namespace sqlbridge::protocol
