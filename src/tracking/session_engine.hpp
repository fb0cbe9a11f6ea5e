/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include <qtils/outcome.hpp>

#include "tracking/types.hpp"

namespace tally::tracking {

  /**
   * Owns the presence session lifecycle of every user and the only writer of
   * open sessions and daily totals. Calls must be serialized by the caller.
   */
  class SessionEngine {
   public:
    virtual ~SessionEngine() = default;

    /**
     * Opens a session of the user.
     * @return false if a session is already open (duplicate join)
     */
    virtual outcome::result<bool> startSession(const UserId &user_id,
                                               Instant started_at) = 0;

    /**
     * Closes the session of the user and credits [started_at, ended_at) to
     * the local days it spans.
     * @return seconds credited; 0 if no session was open (spurious leave)
     */
    virtual outcome::result<uint64_t> endSession(const UserId &user_id,
                                                 Instant ended_at) = 0;

    /**
     * Credits [start, end) of the user to local days.
     * @return seconds credited; empty or reversed intervals credit nothing
     */
    virtual outcome::result<uint64_t> accumulateInterval(const UserId &user_id,
                                                         Instant start,
                                                         Instant end) = 0;

    /**
     * Credits time accrued before `midnight` by open sessions started before
     * it and moves their start to `midnight`. Sessions stay open; a repeated
     * call for the same midnight changes nothing.
     * @return number of sessions rolled over
     */
    virtual outcome::result<size_t> rolloverOpenSessions(Instant midnight) = 0;

    /**
     * Replaces all open sessions with one per given user, all started at
     * `started_at`. Downtime before it is never credited.
     */
    virtual outcome::result<void> reseedSessions(
        const std::vector<UserId> &user_ids, Instant started_at) = 0;
  };

}  // namespace tally::tracking
