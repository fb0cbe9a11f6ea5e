/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "testutil/instants.hpp"
#include "tracking/iso_instant.hpp"
#include "tracking/tracking_error.hpp"

using tally::tracking::formatIsoInstant;
using tally::tracking::NaiveAs;
using tally::tracking::parseIsoInstant;
using tally::tracking::TrackingError;
using testutil::utc;
using namespace std::chrono_literals;

TEST(IsoInstantTest, ParsesOffsets) {
  ASSERT_OUTCOME_SUCCESS(zulu, parseIsoInstant("2026-01-01T12:00:00Z"));
  EXPECT_EQ(zulu, utc(2026, 1, 1, 12));

  ASSERT_OUTCOME_SUCCESS(utc_offset,
                         parseIsoInstant("2026-01-01T12:00:00+00:00"));
  EXPECT_EQ(utc_offset, utc(2026, 1, 1, 12));

  ASSERT_OUTCOME_SUCCESS(west, parseIsoInstant("2026-01-01T07:00:00-05:00"));
  EXPECT_EQ(west, utc(2026, 1, 1, 12));

  ASSERT_OUTCOME_SUCCESS(east, parseIsoInstant("2026-01-01 17:30:00+05:30"));
  EXPECT_EQ(east, utc(2026, 1, 1, 12));
}

TEST(IsoInstantTest, FractionIsTruncatedToMilliseconds) {
  ASSERT_OUTCOME_SUCCESS(micro,
                         parseIsoInstant("2026-01-01T12:00:00.123456+00:00"));
  EXPECT_EQ(micro, utc(2026, 1, 1, 12) + 123ms);

  ASSERT_OUTCOME_SUCCESS(tenth, parseIsoInstant("2026-01-01T12:00:00.5Z"));
  EXPECT_EQ(tenth, utc(2026, 1, 1, 12) + 500ms);
}

/**
 * @given timestamp without offset
 * @when parse it rejecting or accepting naive input
 * @then it is an error, or the same wall time in UTC
 */
TEST(IsoInstantTest, NaiveTimestamp) {
  EXPECT_OUTCOME_ERROR(res,
                       parseIsoInstant("2026-01-01T12:00:00"),
                       TrackingError::INVALID_TIMESTAMP);
  ASSERT_OUTCOME_SUCCESS(naive,
                         parseIsoInstant("2026-01-01T12:00:00", NaiveAs::Utc));
  EXPECT_EQ(naive, utc(2026, 1, 1, 12));
}

TEST(IsoInstantTest, RejectsMalformed) {
  for (auto bad : {"", "2026-01-01", "2026-01-01T25:00:00Z",
                   "2026-01-01T12:60:00Z", "2026-02-30T12:00:00Z",
                   "2026-01-01T12:00:00.Z", "2026-01-01T12:00:00+0500",
                   "2026-01-01X12:00:00Z", "2026-01-01T12:00:00 UTC"}) {
    EXPECT_OUTCOME_ERROR(res,
                         parseIsoInstant(bad, NaiveAs::Utc),
                         TrackingError::INVALID_TIMESTAMP);
  }
}

TEST(IsoInstantTest, FormatIsReadBack) {
  auto instant = utc(2026, 3, 8, 7, 5, 9) + 42ms;
  auto text = formatIsoInstant(instant);
  EXPECT_EQ(text, "2026-03-08T07:05:09.042+00:00");
  ASSERT_OUTCOME_SUCCESS(parsed, parseIsoInstant(text));
  EXPECT_EQ(parsed, instant);

  EXPECT_EQ(formatIsoInstant(utc(2026, 3, 8)), "2026-03-08T00:00:00+00:00");
}
