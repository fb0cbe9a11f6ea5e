/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <limits>

#include <qtils/test/outcome.hpp>

#include "storage/counter_merge.hpp"
#include "storage/storage_error.hpp"

using tally::storage::decodeCounter;
using tally::storage::encodeCounter;
using tally::storage::kCounterSize;
using tally::storage::mergeCounters;
using tally::storage::StorageError;

TEST(CounterMergeTest, EncodingIsLittleEndian) {
  EXPECT_EQ(encodeCounter(0x0102),
            (qtils::ByteVec{0x02, 0x01, 0, 0, 0, 0, 0, 0}));
  ASSERT_OUTCOME_SUCCESS(value, decodeCounter(encodeCounter(420)));
  EXPECT_EQ(value, 420);
}

TEST(CounterMergeTest, MalformedCounter) {
  qtils::ByteVec short_counter(kCounterSize - 1, 0);
  EXPECT_OUTCOME_ERROR(
      res, decodeCounter(short_counter), StorageError::CORRUPTION);
  EXPECT_OUTCOME_ERROR(res2,
                       mergeCounters(std::nullopt, short_counter),
                       StorageError::CORRUPTION);
  auto operand = encodeCounter(1);
  EXPECT_OUTCOME_ERROR(res3,
                       mergeCounters(qtils::ByteView{short_counter}, operand),
                       StorageError::CORRUPTION);
}

/**
 * @given absent value and two operands
 * @when they are merged in either order
 * @then the result is their sum
 */
TEST(CounterMergeTest, MergesSumUp) {
  auto a = encodeCounter(120);
  auto b = encodeCounter(300);

  ASSERT_OUTCOME_SUCCESS(first, mergeCounters(std::nullopt, a));
  EXPECT_EQ(first, a);
  ASSERT_OUTCOME_SUCCESS(ab, mergeCounters(qtils::ByteView{first}, b));

  ASSERT_OUTCOME_SUCCESS(second, mergeCounters(std::nullopt, b));
  ASSERT_OUTCOME_SUCCESS(ba, mergeCounters(qtils::ByteView{second}, a));

  EXPECT_EQ(ab, ba);
  ASSERT_OUTCOME_SUCCESS(sum, decodeCounter(ab));
  EXPECT_EQ(sum, 420);
}

TEST(CounterMergeTest, SumSaturates) {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  auto existing = encodeCounter(kMax - 1);
  ASSERT_OUTCOME_SUCCESS(
      merged, mergeCounters(qtils::ByteView{existing}, encodeCounter(5)));
  ASSERT_OUTCOME_SUCCESS(value, decodeCounter(merged));
  EXPECT_EQ(value, kMax);
}
