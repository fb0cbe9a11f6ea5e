/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace tally::storage {

  /**
   * @brief Logical key spaces of the database. Each space is a separate
   * column family in RocksDB.
   */
  enum class Space : uint8_t {
    Default = 0,   ///< Small singleton records (scheduler/command markers)
    OpenSessions,  ///< user id -> open session record
    DailyTotals,   ///< day key + user id -> accumulated seconds counter

    Total  ///< Number of spaces (must be last)
  };

  constexpr size_t SpacesCount = static_cast<size_t>(Space::Total);

}  // namespace tally::storage
