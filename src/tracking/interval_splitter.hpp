/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <vector>

#include <qtils/outcome.hpp>

#include "tracking/types.hpp"

namespace tally::tracking {

  /**
   * Splits [start, end) at the local midnights of `zone`.
   *
   * Chunks are in chronological order, one per local day touched, and never
   * carry zero seconds. Lengths are absolute time differences, so DST shifts
   * only move where a boundary falls. Seconds of the chunks sum up to the
   * whole seconds of `end - start`.
   *
   * @return empty sequence if end <= start, TrackingError::INVALID_INTERVAL
   * if a bound is outside years 1970..9999
   */
  outcome::result<std::vector<DayChunk>> splitInterval(
      Instant start, Instant end, const std::chrono::time_zone &zone);

}  // namespace tally::tracking
