/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "storage/spaced_storage.hpp"
#include "tracking/presence_store.hpp"

namespace tally::tracking {

  /**
   * PresenceStore on top of SpacedStorage.
   */
  class PresenceStoreImpl : public PresenceStore,
                            Singleton<PresenceStoreImpl> {
   public:
    PresenceStoreImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                      qtils::SharedRef<storage::SpacedStorage> storage);

    outcome::result<void> upsertOpenSession(const UserId &user_id,
                                            Instant started_at) override;

    outcome::result<std::optional<OpenSession>> getOpenSession(
        const UserId &user_id) const override;

    outcome::result<void> deleteOpenSession(const UserId &user_id) override;

    outcome::result<std::vector<OpenSession>> listOpenSessions() const override;

    outcome::result<void> clearOpenSessions() override;

    outcome::result<void> addDailySeconds(const DayKey &day_key,
                                          const UserId &user_id,
                                          int64_t delta) override;

    outcome::result<void> closeInterval(
        const UserId &user_id,
        const std::vector<DayChunk> &chunks,
        std::optional<Instant> reopened_at) override;

    outcome::result<std::vector<DailyTotal>> listDailyTotals(
        const DayKey &day_key) const override;

    outcome::result<std::optional<std::string>> getMeta(
        std::string_view key) const override;

    outcome::result<void> setMeta(std::string_view key,
                                  std::string_view value) override;

   private:
    log::Logger logger_;
    qtils::SharedRef<storage::SpacedStorage> storage_;
    std::shared_ptr<storage::BufferStorage> sessions_;
    std::shared_ptr<storage::BufferStorage> totals_;
    std::shared_ptr<storage::BufferStorage> meta_;
  };

}  // namespace tally::tracking
