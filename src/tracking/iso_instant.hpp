/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <qtils/outcome.hpp>

#include "tracking/types.hpp"

namespace tally::tracking {

  /// How to read a timestamp written without a UTC offset
  enum class NaiveAs : uint8_t {
    Reject,
    Utc,
  };

  /**
   * Parses "YYYY-MM-DD[T| ]HH:MM:SS[.fff...][Z|+HH:MM|-HH:MM]". Fractions
   * finer than milliseconds are truncated.
   * @return TrackingError::INVALID_TIMESTAMP for malformed input, or for
   * input without offset when `naive` is NaiveAs::Reject
   */
  outcome::result<Instant> parseIsoInstant(std::string_view text,
                                           NaiveAs naive = NaiveAs::Reject);

  /// "YYYY-MM-DDTHH:MM:SS[.mmm]+00:00"
  std::string formatIsoInstant(Instant instant);

}  // namespace tally::tracking
