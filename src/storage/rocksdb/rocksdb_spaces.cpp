/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_spaces.hpp"

#include <algorithm>
#include <array>

#include <boost/assert.hpp>
#include <rocksdb/db.h>

namespace tally::storage {

  // Names of non-default spaces, in Space order
  static constexpr std::array<std::string_view, SpacesCount - 1> kNames{
      "open_sessions",
      "daily_totals",
  };

  std::string_view spaceName(Space space) {
    if (space != Space::Default) {
      BOOST_ASSERT(space < Space::Total);
      return kNames[static_cast<size_t>(space) - 1];
    }
    return rocksdb::kDefaultColumnFamilyName;
  }

  std::optional<Space> spaceFromString(std::string_view string) {
    if (string == rocksdb::kDefaultColumnFamilyName) {
      return Space::Default;
    }
    const auto it = std::ranges::find(kNames, string);
    if (it == kNames.end()) {
      return std::nullopt;
    }
    return static_cast<Space>(std::distance(kNames.begin(), it) + 1);
  }

}  // namespace tally::storage
