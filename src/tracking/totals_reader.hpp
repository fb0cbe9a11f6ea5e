/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>

#include "tracking/types.hpp"

namespace tally::tracking {

  /**
   * Read side of the tracker. Never writes to the store.
   */
  class TotalsReader {
   public:
    virtual ~TotalsReader() = default;

    /**
     * Persisted totals of the day. With `include_live`, each open session
     * adds the part of [started_at, now) that falls into the day.
     * @return TrackingError::INVALID_DAY_KEY for a malformed day key
     */
    [[nodiscard]] virtual outcome::result<Totals> getTotalsForDay(
        const DayKey &day_key, bool include_live, Instant now) const = 0;
  };

}  // namespace tally::tracking
