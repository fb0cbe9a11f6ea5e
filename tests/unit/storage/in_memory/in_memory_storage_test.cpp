/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "storage/counter_merge.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "storage/storage_error.hpp"

using tally::storage::BufferStorage;
using tally::storage::ByteVec;
using tally::storage::ByteView;
using tally::storage::decodeCounter;
using tally::storage::encodeCounter;
using tally::storage::InMemorySpacedStorage;
using tally::storage::InMemoryStorage;
using tally::storage::Space;
using tally::storage::StorageError;

namespace {
  ByteVec bytes(std::string_view text) {
    return ByteVec(text.begin(), text.end());
  }

  std::string text(ByteView bytes) {
    return {bytes.begin(), bytes.end()};
  }
}  // namespace

TEST(InMemoryStorageTest, PutGetRemove) {
  InMemoryStorage storage;
  auto key = bytes("key");

  EXPECT_OUTCOME_ERROR(res, storage.get(key), StorageError::NOT_FOUND);
  ASSERT_OUTCOME_SUCCESS(absent, storage.tryGet(key));
  EXPECT_FALSE(absent.has_value());

  ASSERT_OUTCOME_SUCCESS(storage.put(key, bytes("value")));
  ASSERT_OUTCOME_SUCCESS(value, storage.get(key));
  EXPECT_EQ(text(value.view()), "value");
  ASSERT_OUTCOME_SUCCESS(contains, storage.contains(key));
  EXPECT_TRUE(contains);
  EXPECT_EQ(storage.byteSizeHint(), 5);

  ASSERT_OUTCOME_SUCCESS(storage.remove(key));
  ASSERT_OUTCOME_SUCCESS(contains_after, storage.contains(key));
  EXPECT_FALSE(contains_after);
  EXPECT_EQ(storage.byteSizeHint(), 0);

  // removing again is fine
  EXPECT_OUTCOME_SUCCESS(storage.remove(key));
}

TEST(InMemoryStorageTest, MergeNeedsRule) {
  InMemoryStorage storage;
  EXPECT_OUTCOME_ERROR(res,
                       storage.merge(bytes("k"), encodeCounter(1)),
                       StorageError::NOT_SUPPORTED);
}

/**
 * @given cursor over keys written out of order
 * @when it walks from a prefix
 * @then keys come in byte order
 */
TEST(InMemoryStorageTest, CursorWalksInKeyOrder) {
  InMemoryStorage storage;
  for (auto key :
       {"2026-01-02/b", "2026-01-01/z", "2026-01-02/a", "2026-01-03/a"}) {
    ASSERT_OUTCOME_SUCCESS(storage.put(bytes(key), bytes("v")));
  }

  auto cursor = storage.cursor();
  ASSERT_OUTCOME_SUCCESS(valid, cursor->seek(bytes("2026-01-02/")));
  ASSERT_TRUE(valid);
  std::vector<ByteVec> keys;
  while (cursor->isValid()) {
    keys.push_back(cursor->key().value());
    ASSERT_OUTCOME_SUCCESS(cursor->next());
  }
  EXPECT_EQ(keys,
            (std::vector<ByteVec>{bytes("2026-01-02/a"),
                                  bytes("2026-01-02/b"),
                                  bytes("2026-01-03/a")}));

  ASSERT_OUTCOME_SUCCESS(last, cursor->seekLast());
  ASSERT_TRUE(last);
  EXPECT_EQ(cursor->key(), bytes("2026-01-03/a"));
  ASSERT_OUTCOME_SUCCESS(cursor->prev());
  EXPECT_EQ(cursor->key(), bytes("2026-01-02/b"));
}

TEST(InMemoryStorageTest, BatchAppliesOnCommit) {
  InMemoryStorage storage;
  ASSERT_OUTCOME_SUCCESS(storage.put(bytes("a"), bytes("1")));

  auto batch = storage.batch();
  ASSERT_OUTCOME_SUCCESS(batch->remove(bytes("a")));
  ASSERT_OUTCOME_SUCCESS(batch->put(bytes("b"), bytes("2")));
  ASSERT_OUTCOME_SUCCESS(before, storage.contains(bytes("b")));
  EXPECT_FALSE(before);

  ASSERT_OUTCOME_SUCCESS(batch->commit());
  ASSERT_OUTCOME_SUCCESS(has_a, storage.contains(bytes("a")));
  EXPECT_FALSE(has_a);
  ASSERT_OUTCOME_SUCCESS(has_b, storage.contains(bytes("b")));
  EXPECT_TRUE(has_b);
}

/**
 * @given spaced storage
 * @when counters are merged into the daily totals space
 * @then they add up, while other spaces refuse merges
 */
TEST(InMemorySpacedStorageTest, DailyTotalsMergeCounters) {
  InMemorySpacedStorage spaced;
  auto totals = spaced.getSpace(Space::DailyTotals);
  EXPECT_EQ(totals, spaced.getSpace(Space::DailyTotals));

  auto key = bytes("2026-01-10/u1");
  ASSERT_OUTCOME_SUCCESS(totals->merge(key, encodeCounter(120)));
  ASSERT_OUTCOME_SUCCESS(totals->merge(key, encodeCounter(300)));
  ASSERT_OUTCOME_SUCCESS(stored, totals->get(key));
  ASSERT_OUTCOME_SUCCESS(seconds, decodeCounter(stored.view()));
  EXPECT_EQ(seconds, 420);

  EXPECT_OUTCOME_ERROR(res,
                       spaced.getSpace(Space::OpenSessions)
                           ->merge(key, encodeCounter(1)),
                       StorageError::NOT_SUPPORTED);
}

/**
 * @given batch spanning the sessions and daily totals spaces
 * @when it is committed
 * @then puts land and merges of one key add up, and nothing is visible before
 * the commit
 */
TEST(InMemorySpacedStorageTest, BatchSpansSpaces) {
  InMemorySpacedStorage spaced;
  auto sessions = spaced.getSpace(Space::OpenSessions);
  auto totals = spaced.getSpace(Space::DailyTotals);
  auto key = bytes("2026-01-10/u1");
  ASSERT_OUTCOME_SUCCESS(totals->merge(key, encodeCounter(5)));

  auto batch = spaced.createBatch();
  ASSERT_OUTCOME_SUCCESS(
      batch->put(Space::OpenSessions, bytes("u1"), bytes("s")));
  ASSERT_OUTCOME_SUCCESS(
      batch->merge(Space::DailyTotals, key, encodeCounter(10)));
  ASSERT_OUTCOME_SUCCESS(
      batch->merge(Space::DailyTotals, key, encodeCounter(20)));
  ASSERT_OUTCOME_SUCCESS(pending, sessions->contains(bytes("u1")));
  EXPECT_FALSE(pending);

  ASSERT_OUTCOME_SUCCESS(batch->commit());
  ASSERT_OUTCOME_SUCCESS(session, sessions->get(bytes("u1")));
  EXPECT_EQ(text(session.view()), "s");
  ASSERT_OUTCOME_SUCCESS(stored, totals->get(key));
  ASSERT_OUTCOME_SUCCESS(seconds, decodeCounter(stored.view()));
  EXPECT_EQ(seconds, 35);
}

/**
 * @given batch whose last operation merges into a space without a merge rule
 * @when it is committed
 * @then the commit fails and earlier operations are not applied either
 */
TEST(InMemorySpacedStorageTest, FailedBatchWritesNothing) {
  InMemorySpacedStorage spaced;
  auto sessions = spaced.getSpace(Space::OpenSessions);
  ASSERT_OUTCOME_SUCCESS(sessions->put(bytes("u1"), bytes("old")));

  auto batch = spaced.createBatch();
  ASSERT_OUTCOME_SUCCESS(batch->remove(Space::OpenSessions, bytes("u1")));
  ASSERT_OUTCOME_SUCCESS(batch->merge(
      Space::DailyTotals, bytes("2026-01-10/u1"), encodeCounter(7)));
  ASSERT_OUTCOME_SUCCESS(
      batch->merge(Space::Default, bytes("k"), encodeCounter(1)));
  EXPECT_OUTCOME_ERROR(res, batch->commit(), StorageError::NOT_SUPPORTED);

  ASSERT_OUTCOME_SUCCESS(session, sessions->get(bytes("u1")));
  EXPECT_EQ(text(session.view()), "old");
  ASSERT_OUTCOME_SUCCESS(total,
                         spaced.getSpace(Space::DailyTotals)
                             ->tryGet(bytes("2026-01-10/u1")));
  EXPECT_FALSE(total.has_value());
}
