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
 * @file pending_table.cpp
 * @brief Implementation of the in-flight request registry.
 */

#include "sqlbridge/core/pending_table.hpp"

#include <algorithm>

namespace sqlbridge::core {

bool PendingTable::insert(PendingRequest request)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t id = request.id;
    return entries_.emplace(id, std::move(request)).second;
}

std::optional<PendingRequest> PendingTable::take(std::uint64_t id)
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    PendingRequest request = std::move(it->second);
    entries_.erase(it);
    return request;
}

std::vector<PendingRequest> PendingTable::take_all()
{
    std::vector<PendingRequest> drained;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.reserve(entries_.size());
        for (auto& entry : entries_) {
            drained.push_back(std::move(entry.second));
        }
        entries_.clear();
    }

    std::sort(drained.begin(), drained.end(),
              [](const PendingRequest& a, const PendingRequest& b) { return a.id < b.id; });
    return drained;
}

bool PendingTable::contains(std::uint64_t id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

std::size_t PendingTable::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace sqlbridge::core
