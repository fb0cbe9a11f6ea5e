/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "report/cooldown.hpp"
#include "testutil/instants.hpp"
#include "tracking/tracking_error.hpp"

using tally::report::remainingCooldown;
using tally::tracking::TrackingError;
using testutil::utc;
using namespace std::chrono_literals;

/**
 * @given manual report run 30 minutes ago
 * @when compute remaining cooldown for 1 hour and 20 minutes cooldowns
 * @then 30 minutes remain of the first one, nothing of the second
 */
TEST(CooldownTest, RemainingAfterLastRun) {
  auto now = utc(2026, 1, 1, 12, 30);
  std::string last_run = "2026-01-01T12:00:00+00:00";

  ASSERT_OUTCOME_SUCCESS(hour, remainingCooldown(last_run, 3600s, now));
  EXPECT_EQ(hour, 1800s);

  ASSERT_OUTCOME_SUCCESS(short_one, remainingCooldown(last_run, 1200s, now));
  EXPECT_EQ(short_one, 0s);
}

TEST(CooldownTest, NoMarkerMeansNoCooldown) {
  auto now = utc(2026, 1, 1, 12, 30);
  ASSERT_OUTCOME_SUCCESS(remaining, remainingCooldown(std::nullopt, 3600s, now));
  EXPECT_EQ(remaining, 0s);
}

TEST(CooldownTest, NonPositiveCooldown) {
  auto now = utc(2026, 1, 1, 12, 30);
  ASSERT_OUTCOME_SUCCESS(
      remaining, remainingCooldown("2026-01-01T12:29:00Z", 0s, now));
  EXPECT_EQ(remaining, 0s);
}

/**
 * @given marker stored without offset
 * @when compute remaining cooldown
 * @then the marker is read as UTC
 */
TEST(CooldownTest, NaiveMarkerIsUtc) {
  auto now = utc(2026, 1, 1, 12, 30);
  ASSERT_OUTCOME_SUCCESS(
      remaining, remainingCooldown("2026-01-01T12:00:00", 3600s, now));
  EXPECT_EQ(remaining, 1800s);
}

TEST(CooldownTest, MalformedMarker) {
  auto now = utc(2026, 1, 1, 12, 30);
  EXPECT_OUTCOME_ERROR(res,
                       remainingCooldown("yesterday", 3600s, now),
                       TrackingError::INVALID_TIMESTAMP);
}

/**
 * @given marker later than now (wall clock moved back)
 * @when compute remaining cooldown
 * @then the skew is added to the cooldown
 */
TEST(CooldownTest, MarkerInFuture) {
  auto now = utc(2026, 1, 1, 12, 0);
  ASSERT_OUTCOME_SUCCESS(
      remaining, remainingCooldown("2026-01-01T12:10:00Z", 3600s, now));
  EXPECT_EQ(remaining, 4200s);
}

TEST(CooldownTest, OverlongCooldownIsCut) {
  auto now = utc(2026, 1, 1, 12, 0);
  ASSERT_OUTCOME_SUCCESS(remaining,
                         remainingCooldown("9999-12-31T00:00:00Z",
                                           std::chrono::seconds::max(),
                                           now));
  auto skew = std::chrono::duration_cast<std::chrono::seconds>(
      utc(9999, 12, 31, 0, 0) - now);
  EXPECT_EQ(remaining, tally::report::kMaxReportCooldown + skew);
}
