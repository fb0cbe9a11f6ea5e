/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tracking/impl/presence_store_impl.hpp"

#include <algorithm>

#include "serde/serialization.hpp"
#include "storage/counter_merge.hpp"
#include "tracking/impl/storage_util.hpp"

namespace tally::tracking {

  PresenceStoreImpl::PresenceStoreImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<storage::SpacedStorage> storage)
      : logger_(logsys->getLogger("PresenceStore", "storage")),
        storage_(std::move(storage)),
        sessions_(storage_->getSpace(storage::Space::OpenSessions)),
        totals_(storage_->getSpace(storage::Space::DailyTotals)),
        meta_(storage_->getSpace(storage::Space::Default)) {}

  namespace {
    outcome::result<qtils::ByteVec> encodeOpenSession(Instant started_at) {
      OpenSessionRecord record;
      record.started_at_ms =
          static_cast<uint64_t>(started_at.time_since_epoch().count());
      return encode(record);
    }
  }  // namespace

  outcome::result<void> PresenceStoreImpl::upsertOpenSession(
      const UserId &user_id, Instant started_at) {
    OUTCOME_TRY(encoded, encodeOpenSession(started_at));
    return sessions_->put(openSessionKey(user_id), std::move(encoded));
  }

  outcome::result<std::optional<OpenSession>> PresenceStoreImpl::getOpenSession(
      const UserId &user_id) const {
    OUTCOME_TRY(encoded_opt, sessions_->tryGet(openSessionKey(user_id)));
    if (not encoded_opt.has_value()) {
      return std::nullopt;
    }
    OUTCOME_TRY(record, decode<OpenSessionRecord>(encoded_opt.value()));
    return OpenSession{
        .user_id = user_id,
        .started_at = Instant{std::chrono::milliseconds{record.started_at_ms}},
    };
  }

  outcome::result<void> PresenceStoreImpl::deleteOpenSession(
      const UserId &user_id) {
    return sessions_->remove(openSessionKey(user_id));
  }

  outcome::result<std::vector<OpenSession>>
  PresenceStoreImpl::listOpenSessions() const {
    std::vector<OpenSession> sessions;
    auto cursor = sessions_->cursor();
    OUTCOME_TRY(cursor->seekFirst());
    while (cursor->isValid()) {
      auto key = cursor->key().value();
      auto value = cursor->value().value();
      auto record = decode<OpenSessionRecord>(value);
      if (record.has_error()) {
        SL_ERROR(logger_,
                 "Malformed open session of '{}': {}",
                 textOf(key),
                 record.error().message());
        return record.error();
      }
      sessions.push_back(OpenSession{
          .user_id = UserId{textOf(key)},
          .started_at = Instant{
              std::chrono::milliseconds{record.value().started_at_ms}},
      });
      OUTCOME_TRY(cursor->next());
    }
    return sessions;
  }

  outcome::result<void> PresenceStoreImpl::clearOpenSessions() {
    auto batch = sessions_->batch();
    auto cursor = sessions_->cursor();
    OUTCOME_TRY(cursor->seekFirst());
    size_t count = 0;
    while (cursor->isValid()) {
      OUTCOME_TRY(batch->remove(cursor->key().value()));
      ++count;
      OUTCOME_TRY(cursor->next());
    }
    OUTCOME_TRY(batch->commit());
    SL_DEBUG(logger_, "Cleared {} open sessions", count);
    return outcome::success();
  }

  outcome::result<void> PresenceStoreImpl::addDailySeconds(
      const DayKey &day_key, const UserId &user_id, int64_t delta) {
    if (delta <= 0) {
      return outcome::success();
    }
    return totals_->merge(dailyTotalKey(day_key, user_id),
                          storage::encodeCounter(static_cast<uint64_t>(delta)));
  }

  outcome::result<void> PresenceStoreImpl::closeInterval(
      const UserId &user_id,
      const std::vector<DayChunk> &chunks,
      std::optional<Instant> reopened_at) {
    auto batch = storage_->createBatch();
    for (const auto &chunk : chunks) {
      if (chunk.seconds == 0) {
        continue;
      }
      OUTCOME_TRY(batch->merge(storage::Space::DailyTotals,
                               dailyTotalKey(chunk.day_key, user_id),
                               storage::encodeCounter(chunk.seconds)));
    }
    if (reopened_at.has_value()) {
      OUTCOME_TRY(encoded, encodeOpenSession(reopened_at.value()));
      OUTCOME_TRY(batch->put(storage::Space::OpenSessions,
                             openSessionKey(user_id),
                             std::move(encoded)));
    } else {
      OUTCOME_TRY(
          batch->remove(storage::Space::OpenSessions, openSessionKey(user_id)));
    }
    return batch->commit();
  }

  outcome::result<std::vector<DailyTotal>> PresenceStoreImpl::listDailyTotals(
      const DayKey &day_key) const {
    std::vector<DailyTotal> totals;
    auto cursor = totals_->cursor();
    OUTCOME_TRY(cursor->seek(dailyTotalPrefix(day_key)));
    while (cursor->isValid()) {
      auto key = cursor->key().value();
      auto user_id = userOfDailyTotalKey(day_key, key);
      if (not user_id.has_value()) {
        // left the day's key range
        break;
      }
      OUTCOME_TRY(seconds, storage::decodeCounter(cursor->value().value()));
      totals.push_back(DailyTotal{
          .day_key = day_key,
          .user_id = std::move(user_id.value()),
          .seconds = seconds,
      });
      OUTCOME_TRY(cursor->next());
    }
    std::ranges::sort(totals, [](const DailyTotal &lhs, const DailyTotal &rhs) {
      if (lhs.seconds != rhs.seconds) {
        return lhs.seconds > rhs.seconds;
      }
      return lhs.user_id < rhs.user_id;
    });
    return totals;
  }

  outcome::result<std::optional<std::string>> PresenceStoreImpl::getMeta(
      std::string_view key) const {
    OUTCOME_TRY(value_opt, meta_->tryGet(metaKey(key)));
    if (not value_opt.has_value()) {
      return std::nullopt;
    }
    return std::string{textOf(value_opt.value())};
  }

  outcome::result<void> PresenceStoreImpl::setMeta(std::string_view key,
                                                   std::string_view value) {
    return meta_->put(metaKey(key), bytesOf(value));
  }

}  // namespace tally::tracking
