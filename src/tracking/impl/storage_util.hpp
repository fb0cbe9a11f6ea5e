/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>

#include <qtils/byte_vec.hpp>
#include <sszpp/ssz++.hpp>

#include "tracking/types.hpp"

/**
 * Storage schema overview
 *
 * Space::OpenSessions
 *   key:   user id bytes
 *   value: SSZ OpenSessionRecord
 *
 * Space::DailyTotals
 *   key:   "<YYYY-MM-DD>/<user id>"; rows of a day share the "<day>/" prefix
 *          and form one contiguous key range
 *   value: SSZ uint64 counter, incremented by merge
 *
 * Space::Default
 *   key:   ":tally:meta:<name>"
 *   value: raw UTF-8 bytes
 */

namespace tally::tracking {

  struct OpenSessionRecord : ssz::ssz_container {
    /// milliseconds since epoch
    uint64_t started_at_ms = 0;

    SSZ_CONT(started_at_ms);
  };

  inline qtils::ByteVec bytesOf(std::string_view text) {
    return qtils::ByteVec(text.begin(), text.end());
  }

  inline std::string_view textOf(qtils::ByteView bytes) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
  }

  inline qtils::ByteVec openSessionKey(std::string_view user_id) {
    return bytesOf(user_id);
  }

  /// Common prefix of all DailyTotals keys of a day
  inline qtils::ByteVec dailyTotalPrefix(std::string_view day_key) {
    auto key = bytesOf(day_key);
    key.push_back('/');
    return key;
  }

  inline qtils::ByteVec dailyTotalKey(std::string_view day_key,
                                      std::string_view user_id) {
    auto key = dailyTotalPrefix(day_key);
    key.insert(key.end(), user_id.begin(), user_id.end());
    return key;
  }

  /**
   * @return user id of a DailyTotals key if it belongs to the day
   */
  std::optional<UserId> userOfDailyTotalKey(std::string_view day_key,
                                            qtils::ByteView key);

  inline qtils::ByteVec metaKey(std::string_view name) {
    constexpr std::string_view kMetaPrefix = ":tally:meta:";
    auto key = bytesOf(kMetaPrefix);
    key.insert(key.end(), name.begin(), name.end());
    return key;
  }

}  // namespace tally::tracking
