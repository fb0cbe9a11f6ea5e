/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/outcome.hpp>

#include "tracking/types.hpp"

namespace tally::tracking {

  /**
   * Durable state of the tracker: open sessions, per-day totals and metadata
   * markers. Every write is durable when the call returns. Failures are
   * reported as storage errors and never retried here.
   */
  class PresenceStore {
   public:
    virtual ~PresenceStore() = default;

    /// Creates or replaces the open session of the user
    virtual outcome::result<void> upsertOpenSession(const UserId &user_id,
                                                    Instant started_at) = 0;

    [[nodiscard]] virtual outcome::result<std::optional<OpenSession>>
    getOpenSession(const UserId &user_id) const = 0;

    /// Removing an absent session is not an error
    virtual outcome::result<void> deleteOpenSession(const UserId &user_id) = 0;

    [[nodiscard]] virtual outcome::result<std::vector<OpenSession>>
    listOpenSessions() const = 0;

    virtual outcome::result<void> clearOpenSessions() = 0;

    /**
     * Atomically adds `delta` seconds to the total of (day, user), creating
     * the row if absent. Concurrent increments of the same row sum up.
     * Non-positive delta is a no-op.
     */
    virtual outcome::result<void> addDailySeconds(const DayKey &day_key,
                                                  const UserId &user_id,
                                                  int64_t delta) = 0;

    /**
     * Credits `chunks` to the day totals of the user and, in the same atomic
     * write, moves the start of the user's open session to `reopened_at`, or
     * removes the session if `reopened_at` is empty. On failure nothing is
     * written, so the call may be repeated.
     */
    virtual outcome::result<void> closeInterval(
        const UserId &user_id,
        const std::vector<DayChunk> &chunks,
        std::optional<Instant> reopened_at) = 0;

    /**
     * @return totals of the day, by seconds descending then user id
     */
    [[nodiscard]] virtual outcome::result<std::vector<DailyTotal>>
    listDailyTotals(const DayKey &day_key) const = 0;

    [[nodiscard]] virtual outcome::result<std::optional<std::string>> getMeta(
        std::string_view key) const = 0;

    virtual outcome::result<void> setMeta(std::string_view key,
                                          std::string_view value) = 0;
  };

}  // namespace tally::tracking
