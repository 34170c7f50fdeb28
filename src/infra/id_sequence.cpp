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
 * @file id_sequence.cpp
 * @brief Implementation of the request identifier counter.
 */

#include "sqlbridge/infra/id_sequence.hpp"

namespace sqlbridge::infra {

/**
 * @brief Allocates the next identifier.
 *
 * `fetch_add` returns the previous value, so concurrent callers always observe distinct
 * results even without an external lock.
 */
std::uint64_t IdSequence::next()
{
    return last_.fetch_add(1, std::memory_order_relaxed) + 1;
}

std::uint64_t IdSequence::last() const
{
    return last_.load(std::memory_order_relaxed);
}

} // namespace sqlbridge::infra
