/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <qtils/test/outcome.hpp>

#include "app/impl/command_processor.hpp"
#include "app/impl/event_loop.hpp"
#include "app/impl/presence_tracker.hpp"
#include "app/meta_keys.hpp"
#include "mock/app/configuration_mock.hpp"
#include "mock/app/state_manager_mock.hpp"
#include "mock/clock/manual_clock.hpp"
#include "mock/report/report_sink_mock.hpp"
#include "report/reporter.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/instants.hpp"
#include "testutil/prepare_loggers.hpp"
#include "tracking/impl/presence_store_impl.hpp"
#include "tracking/impl/session_engine_impl.hpp"
#include "tracking/impl/totals_reader_impl.hpp"

using tally::app::CommandProcessor;
using tally::app::Configuration;
using tally::app::ConfigurationMock;
using tally::app::EventLoop;
using tally::app::kLastManualReportAt;
using tally::app::PresenceTracker;
using tally::app::StateManagerMock;
using tally::clock::ManualClock;
using tally::report::MemberDirectory;
using tally::report::Reporter;
using tally::report::ReportSinkMock;
using tally::tracking::LocalCalendar;
using tally::tracking::PresenceStoreImpl;
using tally::tracking::SessionEngineImpl;
using tally::tracking::TotalsReaderImpl;
using testing::_;
using testing::NiceMock;
using testing::Return;
using testing::ReturnRef;
using testutil::DummyError;
using testutil::utc;
using namespace std::chrono_literals;

class CommandProcessorTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    auto logsys = testutil::prepareLoggers();

    tracking_config.timezone = "America/New_York";
    tracking_config.channel = "study-hall";
    tracking_config.report_cooldown = 1h;
    members = {{"u1", "alice"}};
    config = std::make_shared<ConfigurationMock>();
    EXPECT_CALL(*config, tracking())
        .WillRepeatedly(ReturnRef(tracking_config));
    EXPECT_CALL(*config, members()).WillRepeatedly(ReturnRef(members));

    ASSERT_OUTCOME_SUCCESS(created, LocalCalendar::create("America/New_York"));
    auto calendar = std::make_shared<LocalCalendar>(created);

    state_manager = std::make_shared<NiceMock<StateManagerMock>>();
    event_loop = std::make_shared<EventLoop>(logsys, state_manager);
    clock = std::make_shared<ManualClock>(morning);
    store = std::make_shared<PresenceStoreImpl>(
        logsys, std::make_shared<InMemorySpacedStorage>());
    auto engine =
        std::make_shared<SessionEngineImpl>(logsys, store, calendar);
    tracker = std::make_shared<PresenceTracker>(
        logsys, config, state_manager, event_loop, clock, engine);
    sink = std::make_shared<ReportSinkMock>();
    auto reporter = std::make_shared<Reporter>(
        logsys,
        config,
        std::make_shared<TotalsReaderImpl>(logsys, store, calendar),
        std::make_shared<MemberDirectory>(config),
        sink);
    commands = std::make_shared<CommandProcessor>(
        logsys, config, clock, calendar, store, tracker, reporter);
  }

  void TearDown() override {
    commands.reset();
    tracker.reset();
    config.reset();
  }

  /// u1 present since 10:00 local time, clock moved 5 minutes on
  void presentForFiveMinutes() {
    ASSERT_OUTCOME_SUCCESS(tracker->onSnapshot({"u1"}));
    clock->advance(5min);
  }

  Configuration::TrackingConfig tracking_config;
  Configuration::Members members;
  std::shared_ptr<ConfigurationMock> config;
  std::shared_ptr<NiceMock<StateManagerMock>> state_manager;
  std::shared_ptr<EventLoop> event_loop;
  std::shared_ptr<ManualClock> clock;
  std::shared_ptr<PresenceStoreImpl> store;
  std::shared_ptr<PresenceTracker> tracker;
  std::shared_ptr<ReportSinkMock> sink;
  std::shared_ptr<CommandProcessor> commands;

  // 10:00 EST of Jan 10
  tally::tracking::Instant morning = utc(2026, 1, 10, 15, 0);

  static constexpr auto kDaySoFar =
      "**Daily Presence - 2026-01-10**\n"
      "Tracked channel: #study-hall\n"
      "- alice: `00:05:00`";
};

TEST_F(CommandProcessorTest, Status) {
  EXPECT_EQ(commands->status(),
            "Tracker status: waiting for snapshot\n"
            "Tracked channel: #study-hall\n"
            "Timezone: `America/New_York`\n"
            "Current local time: `2026-01-10 10:00:00 -05:00 (EST)`\n"
            "Next scheduled midnight check: "
            "`2026-01-11 00:00:00 -05:00 (EST)`\n"
            "report-now cooldown remaining: `00:00:00`");

  ASSERT_OUTCOME_SUCCESS(tracker->onSnapshot({}));
  EXPECT_THAT(commands->status(),
              testing::StartsWith("Tracker status: online\n"));
}

TEST_F(CommandProcessorTest, TodayIncludesOpenSessions) {
  EXPECT_EQ(commands->today(), "No tracked activity for 2026-01-10.");
  presentForFiveMinutes();
  EXPECT_EQ(commands->today(),
            "Today's totals (2026-01-10):\n- alice: `00:05:00`");
}

/**
 * @given delivered report-now
 * @when report-now is asked again within the cooldown and after it
 * @then the second request is refused with the remaining time, the third one
 * is posted
 */
TEST_F(CommandProcessorTest, ReportNowCooldown) {
  presentForFiveMinutes();
  EXPECT_CALL(*sink, deliverMock(kDaySoFar))
      .WillOnce(Return(outcome::success()));
  EXPECT_EQ(commands->reportNow(),
            "Posted day-so-far report for `2026-01-10`.");
  ASSERT_OUTCOME_SUCCESS(marker, store->getMeta(kLastManualReportAt));
  EXPECT_TRUE(marker.has_value());

  clock->advance(10min);
  EXPECT_EQ(commands->reportNow(),
            "Global cooldown active. Try again in `00:50:00`.");
  EXPECT_THAT(
      commands->status(),
      testing::EndsWith("report-now cooldown remaining: `00:50:00`"));

  clock->advance(50min);
  EXPECT_CALL(*sink, deliverMock(_)).WillOnce(Return(outcome::success()));
  EXPECT_EQ(commands->reportNow(),
            "Posted day-so-far report for `2026-01-10`.");
}

/**
 * @given report sink failing
 * @when report-now is asked
 * @then the failure is answered and the cooldown does not start
 */
TEST_F(CommandProcessorTest, FailedReportDoesNotStartCooldown) {
  presentForFiveMinutes();
  EXPECT_CALL(*sink, deliverMock(kDaySoFar))
      .WillOnce(Return(DummyError::ERROR))
      .WillOnce(Return(outcome::success()));

  EXPECT_EQ(commands->reportNow(), "Failed to send report: `dummy error`");
  ASSERT_OUTCOME_SUCCESS(marker, store->getMeta(kLastManualReportAt));
  EXPECT_FALSE(marker.has_value());

  EXPECT_EQ(commands->reportNow(),
            "Posted day-so-far report for `2026-01-10`.");
}

TEST_F(CommandProcessorTest, MalformedMarkerIsIgnored) {
  ASSERT_OUTCOME_SUCCESS(store->setMeta(kLastManualReportAt, "yesterday"));
  EXPECT_CALL(*sink, deliverMock(_)).WillOnce(Return(outcome::success()));
  EXPECT_EQ(commands->reportNow(),
            "Posted day-so-far report for `2026-01-10`.");
}

/**
 * @given marker written without offset by an older version
 * @when report-now is asked 20 minutes after it
 * @then the marker is read as UTC
 */
TEST_F(CommandProcessorTest, NaiveMarkerIsUtc) {
  ASSERT_OUTCOME_SUCCESS(
      store->setMeta(kLastManualReportAt, "2026-01-10T14:40:00"));
  EXPECT_EQ(commands->reportNow(),
            "Global cooldown active. Try again in `00:40:00`.");
}
