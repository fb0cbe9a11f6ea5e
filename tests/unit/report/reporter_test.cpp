/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "mock/app/configuration_mock.hpp"
#include "mock/report/report_sink_mock.hpp"
#include "mock/tracking/totals_reader_mock.hpp"
#include "report/reporter.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/instants.hpp"
#include "testutil/prepare_loggers.hpp"

using tally::app::Configuration;
using tally::app::ConfigurationMock;
using tally::report::MemberDirectory;
using tally::report::ReportRow;
using tally::report::Reporter;
using tally::report::ReportSinkMock;
using tally::tracking::Totals;
using tally::tracking::TotalsReaderMock;
using testing::_;
using testing::Return;
using testing::ReturnRef;
using testutil::DummyError;
using testutil::utc;

class ReporterTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    tracking_config.timezone = "America/New_York";
    tracking_config.channel = "study-hall";
    members = {{"1", "alice"}, {"2", "Bob"}, {"3", "carol"}};

    config = std::make_shared<ConfigurationMock>();
    EXPECT_CALL(*config, tracking())
        .WillRepeatedly(ReturnRef(tracking_config));
    EXPECT_CALL(*config, members()).WillRepeatedly(ReturnRef(members));

    totals_reader = std::make_shared<TotalsReaderMock>();
    sink = std::make_shared<ReportSinkMock>();
    reporter = std::make_shared<Reporter>(
        testutil::prepareLoggers(),
        config,
        totals_reader,
        std::make_shared<MemberDirectory>(config),
        sink);
  }

  void TearDown() override {
    reporter.reset();
    config.reset();
  }

  Configuration::TrackingConfig tracking_config;
  Configuration::Members members;
  std::shared_ptr<ConfigurationMock> config;
  std::shared_ptr<TotalsReaderMock> totals_reader;
  std::shared_ptr<ReportSinkMock> sink;
  std::shared_ptr<Reporter> reporter;

  tally::tracking::Instant now = utc(2026, 1, 10, 15, 0);
};

/**
 * @given totals with ties, zero seconds and an unknown user
 * @when rows are built
 * @then zero rows are dropped, the rest are ordered by seconds descending and
 * then by display name ignoring case, and the unknown user gets a fallback
 * name
 */
TEST_F(ReporterTest, RowsAreOrdered) {
  EXPECT_CALL(*totals_reader, getTotalsForDay("2026-01-10", true, now))
      .WillOnce(Return(
          Totals{{"1", 60}, {"2", 60}, {"3", 0}, {"9", 3600}, {"0", 59}}));

  ASSERT_OUTCOME_SUCCESS(rows,
                         reporter->buildRowsForDay("2026-01-10", true, now));
  EXPECT_EQ(rows,
            (std::vector<ReportRow>{{"9", "User 9", 3600},
                                    {"1", "alice", 60},
                                    {"2", "Bob", 60},
                                    {"0", "User 0", 59}}));
}

TEST_F(ReporterTest, ReportContent) {
  std::vector<ReportRow> rows{{"9", "User 9", 3661}, {"1", "alice", 90}};
  EXPECT_EQ(reporter->buildReportContent("2026-01-10", rows),
            "**Daily Presence - 2026-01-10**\n"
            "Tracked channel: #study-hall\n"
            "- User 9: `01:01:01`\n"
            "- alice: `00:01:30`");
  EXPECT_EQ(reporter->buildReportContent("2026-01-10", {}),
            "**Daily Presence - 2026-01-10**\n"
            "Tracked channel: #study-hall\n"
            "No tracked activity for 2026-01-10.");
}

TEST_F(ReporterTest, TodayContent) {
  EXPECT_EQ(Reporter::buildTodayContent("2026-01-10", {}),
            "No tracked activity for 2026-01-10.");
  EXPECT_EQ(
      Reporter::buildTodayContent("2026-01-10", {{"1", "alice", 420}}),
      "Today's totals (2026-01-10):\n- alice: `00:07:00`");
}

TEST_F(ReporterTest, PostReportDelivers) {
  EXPECT_CALL(*totals_reader, getTotalsForDay("2026-01-09", false, now))
      .WillOnce(Return(Totals{{"2", 7200}}));
  EXPECT_CALL(*sink,
              deliverMock("**Daily Presence - 2026-01-09**\n"
                          "Tracked channel: #study-hall\n"
                          "- Bob: `02:00:00`"))
      .WillOnce(Return(outcome::success()));

  EXPECT_OUTCOME_SUCCESS(reporter->postReport("2026-01-09", false, now));
}

TEST_F(ReporterTest, PostReportErrors) {
  EXPECT_CALL(*totals_reader, getTotalsForDay(_, _, _))
      .WillOnce(Return(DummyError::ERROR))
      .WillOnce(Return(Totals{}));
  EXPECT_CALL(*sink, deliverMock(_)).WillOnce(Return(DummyError::ERROR_2));

  EXPECT_OUTCOME_ERROR(
      res, reporter->postReport("2026-01-09", false, now), DummyError::ERROR);
  EXPECT_OUTCOME_ERROR(
      res2, reporter->postReport("2026-01-09", false, now), DummyError::ERROR_2);
}
