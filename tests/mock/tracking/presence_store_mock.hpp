/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "tracking/presence_store.hpp"

namespace tally::tracking {

  class PresenceStoreMock : public PresenceStore {
   public:
    MOCK_METHOD(outcome::result<void>,
                upsertOpenSession,
                (const UserId &, Instant),
                (override));

    MOCK_METHOD(outcome::result<std::optional<OpenSession>>,
                getOpenSession,
                (const UserId &),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                deleteOpenSession,
                (const UserId &),
                (override));

    MOCK_METHOD(outcome::result<std::vector<OpenSession>>,
                listOpenSessions,
                (),
                (const, override));

    MOCK_METHOD(outcome::result<void>, clearOpenSessions, (), (override));

    MOCK_METHOD(outcome::result<void>,
                addDailySeconds,
                (const DayKey &, const UserId &, int64_t),
                (override));

    MOCK_METHOD(outcome::result<void>,
                closeInterval,
                (const UserId &,
                 const std::vector<DayChunk> &,
                 std::optional<Instant>),
                (override));

    MOCK_METHOD(outcome::result<std::vector<DailyTotal>>,
                listDailyTotals,
                (const DayKey &),
                (const, override));

    MOCK_METHOD(outcome::result<std::optional<std::string>>,
                getMeta,
                (std::string_view),
                (const, override));

    MOCK_METHOD(outcome::result<void>,
                setMeta,
                (std::string_view, std::string_view),
                (override));
  };

}  // namespace tally::tracking
