/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/counter_merge.hpp"
#include "storage/storage_error.hpp"
#include "testutil/storage/base_rocksdb_test.hpp"
#include "tracking/impl/presence_store_impl.hpp"

using tally::storage::decodeCounter;
using tally::storage::encodeCounter;
using tally::storage::Space;
using tally::storage::StorageError;
using tally::tracking::DailyTotal;
using tally::tracking::OpenSession;
using tally::tracking::PresenceStoreImpl;

struct RocksDbSpaceTest : public test::BaseRocksDB_Test {
  RocksDbSpaceTest() : BaseRocksDB_Test("/tmp/tally-test-rocksdb-space") {}

  static Buffer bytes(std::string_view text) {
    return Buffer(text.begin(), text.end());
  }

  static std::string text(BufferView view) {
    return {view.begin(), view.end()};
  }
};

TEST_F(RocksDbSpaceTest, PutGetRemove) {
  auto key = bytes("key");
  EXPECT_OUTCOME_ERROR(res, db_->get(key), StorageError::NOT_FOUND);

  ASSERT_OUTCOME_SUCCESS(db_->put(key, bytes("value")));
  ASSERT_OUTCOME_SUCCESS(value, db_->get(key));
  EXPECT_EQ(text(value.view()), "value");

  ASSERT_OUTCOME_SUCCESS(db_->remove(key));
  ASSERT_OUTCOME_SUCCESS(absent, db_->tryGet(key));
  EXPECT_FALSE(absent.has_value());
}

/**
 * @given daily totals column family
 * @when counters are merged into a missing and then existing row
 * @then the stored value is their sum
 */
TEST_F(RocksDbSpaceTest, CountersMergeInDailyTotals) {
  auto totals = rocks_->getSpace(Space::DailyTotals);
  auto key = bytes("2026-01-10/u1");

  ASSERT_OUTCOME_SUCCESS(totals->merge(key, encodeCounter(120)));
  ASSERT_OUTCOME_SUCCESS(totals->merge(key, encodeCounter(300)));

  ASSERT_OUTCOME_SUCCESS(stored, totals->get(key));
  ASSERT_OUTCOME_SUCCESS(seconds, decodeCounter(stored.view()));
  EXPECT_EQ(seconds, 420);
}

/**
 * @given batch writing to the sessions and daily totals column families
 * @when it is committed
 * @then both writes appear together
 */
TEST_F(RocksDbSpaceTest, BatchSpansColumnFamilies) {
  auto sessions = rocks_->getSpace(Space::OpenSessions);
  auto totals = rocks_->getSpace(Space::DailyTotals);
  auto key = bytes("2026-01-10/u1");
  ASSERT_OUTCOME_SUCCESS(totals->merge(key, encodeCounter(100)));

  auto batch = rocks_->createBatch();
  ASSERT_OUTCOME_SUCCESS(
      batch->merge(Space::DailyTotals, key, encodeCounter(20)));
  ASSERT_OUTCOME_SUCCESS(batch->remove(Space::OpenSessions, bytes("gone")));
  ASSERT_OUTCOME_SUCCESS(
      batch->put(Space::OpenSessions, bytes("u1"), bytes("s")));

  ASSERT_OUTCOME_SUCCESS(pending, sessions->tryGet(bytes("u1")));
  EXPECT_FALSE(pending.has_value());

  ASSERT_OUTCOME_SUCCESS(batch->commit());
  ASSERT_OUTCOME_SUCCESS(session, sessions->get(bytes("u1")));
  EXPECT_EQ(text(session.view()), "s");
  ASSERT_OUTCOME_SUCCESS(stored, totals->get(key));
  ASSERT_OUTCOME_SUCCESS(seconds, decodeCounter(stored.view()));
  EXPECT_EQ(seconds, 120);
}

TEST_F(RocksDbSpaceTest, CursorFollowsKeyOrder) {
  for (auto key : {"b", "a", "c"}) {
    ASSERT_OUTCOME_SUCCESS(db_->put(bytes(key), bytes(key)));
  }
  ASSERT_OUTCOME_SUCCESS(db_->remove(bytes("c")));
  auto cursor = db_->cursor();
  ASSERT_OUTCOME_SUCCESS(valid, cursor->seekFirst());
  ASSERT_TRUE(valid);

  std::string seen;
  while (cursor->isValid()) {
    seen += text(cursor->value()->view());
    ASSERT_OUTCOME_SUCCESS(cursor->next());
  }
  EXPECT_EQ(seen, "ab");
}

/**
 * @given sessions and totals written through the presence store
 * @when the database is closed and opened again
 * @then everything written is still there
 */
TEST_F(RocksDbSpaceTest, StateSurvivesReopen) {
  auto instant = tally::tracking::Instant{std::chrono::milliseconds{
      1768057200123}};  // 2026-01-10T15:00:00.123Z
  {
    PresenceStoreImpl store(logsys, rocks_);
    ASSERT_OUTCOME_SUCCESS(store.upsertOpenSession("u1", instant));
    ASSERT_OUTCOME_SUCCESS(store.addDailySeconds("2026-01-10", "u1", 90));
    ASSERT_OUTCOME_SUCCESS(store.addDailySeconds("2026-01-10", "u1", 30));
    ASSERT_OUTCOME_SUCCESS(store.setMeta("last_auto_report_day", "2026-01-09"));
  }

  open();

  PresenceStoreImpl store(logsys, rocks_);
  ASSERT_OUTCOME_SUCCESS(sessions, store.listOpenSessions());
  EXPECT_EQ(sessions, (std::vector<OpenSession>{{"u1", instant}}));
  ASSERT_OUTCOME_SUCCESS(totals, store.listDailyTotals("2026-01-10"));
  EXPECT_EQ(totals, (std::vector<DailyTotal>{{"2026-01-10", "u1", 120}}));
  ASSERT_OUTCOME_SUCCESS(marker, store.getMeta("last_auto_report_day"));
  EXPECT_EQ(marker, "2026-01-09");
}
