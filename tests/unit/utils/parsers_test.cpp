/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "utils/parsers.hpp"

using tally::util::parseByteQuantity;
using tally::util::parseTimeDuration;

TEST(ParseByteQuantityTest, Units) {
  EXPECT_EQ(parseByteQuantity("4096"), 4096);
  EXPECT_EQ(parseByteQuantity("512Mb"), 512'000'000);
  EXPECT_EQ(parseByteQuantity("512M"), 512ull << 20);
  EXPECT_EQ(parseByteQuantity(" 1 GiB "), 1ull << 30);
  EXPECT_EQ(parseByteQuantity("2k"), 2048);
}

TEST(ParseByteQuantityTest, Malformed) {
  EXPECT_EQ(parseByteQuantity(""), std::nullopt);
  EXPECT_EQ(parseByteQuantity("MiB"), std::nullopt);
  EXPECT_EQ(parseByteQuantity("12 parsecs"), std::nullopt);
  EXPECT_EQ(parseByteQuantity("-1"), std::nullopt);
  EXPECT_EQ(parseByteQuantity("99999999999 TiB"), std::nullopt);
}

TEST(ParseTimeDurationTest, Units) {
  EXPECT_EQ(parseTimeDuration("3600"), 3600);
  EXPECT_EQ(parseTimeDuration("60m"), 3600);
  EXPECT_EQ(parseTimeDuration("1 hour"), 3600);
  EXPECT_EQ(parseTimeDuration("30 Seconds"), 30);
  EXPECT_EQ(parseTimeDuration("2d"), 172800);
}

TEST(ParseTimeDurationTest, Malformed) {
  EXPECT_EQ(parseTimeDuration("soon"), std::nullopt);
  EXPECT_EQ(parseTimeDuration("1 fortnight"), std::nullopt);
  EXPECT_EQ(parseTimeDuration("   "), std::nullopt);
}
