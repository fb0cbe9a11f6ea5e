/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/impl/storage_util.hpp"

namespace tally::tracking {

  std::optional<UserId> userOfDailyTotalKey(std::string_view day_key,
                                            qtils::ByteView key) {
    const auto text = textOf(key);
    // "<day>/" followed by a non-empty user id
    if (text.size() <= day_key.size() + 1 or not text.starts_with(day_key)
        or text[day_key.size()] != '/') {
      return std::nullopt;
    }
    return UserId{text.substr(day_key.size() + 1)};
  }

}  // namespace tally::tracking
