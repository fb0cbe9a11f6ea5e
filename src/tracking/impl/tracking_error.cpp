/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/tracking_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tally::tracking, TrackingError, e) {
  using E = TrackingError;
  switch (e) {
    case E::INVALID_INTERVAL:
      return "Interval bound can not be mapped to a local time";
    case E::INVALID_DAY_KEY:
      return "Day key is not a valid YYYY-MM-DD date";
    case E::INVALID_TIMESTAMP:
      return "Timestamp is malformed or has no UTC offset";
    case E::UNKNOWN_TIMEZONE:
      return "Timezone is not found in the tz database";
  }
  return "Unknown error";
}
