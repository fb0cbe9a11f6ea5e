/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace tally::tracking {

  enum class TrackingError : uint8_t {
    INVALID_INTERVAL = 1,
    INVALID_DAY_KEY,
    INVALID_TIMESTAMP,
    UNKNOWN_TIMEZONE,
  };

}

OUTCOME_HPP_DECLARE_ERROR(tally::tracking, TrackingError);
