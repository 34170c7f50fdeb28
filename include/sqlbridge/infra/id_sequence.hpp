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
 * @file id_sequence.hpp
 * @brief Monotonic request identifier allocation.
 *
 * @details
 * This file declares the `IdSequence` class, the source of the `msgId` values written to the
 * worker. Identifiers are positive, strictly increasing, and never handed out twice by the
 * same sequence, so a late or duplicated worker response can never be matched to a newer
 * request.
 */

#pragma once

#include <atomic>
#include <cstdint>

namespace sqlbridge::infra {

/**
 * @class IdSequence
 * @brief A lock-free counter producing identifiers 1, 2, 3, ...
 *
 * @details
 * Each correlation engine owns exactly one sequence. Sequences are deliberately not
 * copyable: two engines sharing a counter would break per-connection ownership.
 */
class IdSequence {
  public:
    IdSequence() = default;

    IdSequence(const IdSequence&) = delete;
    IdSequence& operator=(const IdSequence&) = delete;

    /**
     * @brief Allocates the next identifier.
     *
     * @return std::uint64_t The new identifier; the first call returns 1.
     *
     * @code
     * sqlbridge::infra::IdSequence ids;
     * auto first = ids.next();  // 1
     * auto second = ids.next(); // 2
     * @endcode
     */
    std::uint64_t next();

    /// @brief Returns the most recently allocated identifier, or 0 if none was allocated.
    std::uint64_t last() const;

  private:
    std::atomic<std::uint64_t> last_{0};
};

} // namespace sqlbridge::infra
