/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "app/feed_command.hpp"

using tally::app::FeedCommand;
using tally::app::parseFeedLine;
namespace feed = tally::app::feed;

TEST(FeedCommandTest, PresenceEvents) {
  EXPECT_EQ(parseFeedLine("join 42"), FeedCommand{feed::Join{"42"}});
  EXPECT_EQ(parseFeedLine("  leave\t42  "), FeedCommand{feed::Leave{"42"}});
  EXPECT_EQ(parseFeedLine("snapshot a  b c"),
            (FeedCommand{feed::Snapshot{{"a", "b", "c"}}}));
  EXPECT_EQ(parseFeedLine("snapshot"), FeedCommand{feed::Snapshot{}});
}

TEST(FeedCommandTest, Commands) {
  EXPECT_EQ(parseFeedLine("today"), FeedCommand{feed::Today{}});
  EXPECT_EQ(parseFeedLine("report-now"), FeedCommand{feed::ReportNow{}});
  EXPECT_EQ(parseFeedLine("status\r"), FeedCommand{feed::Status{}});
  EXPECT_EQ(parseFeedLine("quit"), FeedCommand{feed::Quit{}});
}

TEST(FeedCommandTest, Ignored) {
  EXPECT_EQ(parseFeedLine(""), std::nullopt);
  EXPECT_EQ(parseFeedLine("   "), std::nullopt);
  EXPECT_EQ(parseFeedLine("# join 42"), std::nullopt);
}

/**
 * @given lines with a wrong number of arguments or an unknown verb
 * @when parsed
 * @then nothing is produced
 */
TEST(FeedCommandTest, Malformed) {
  EXPECT_EQ(parseFeedLine("join"), std::nullopt);
  EXPECT_EQ(parseFeedLine("join 1 2"), std::nullopt);
  EXPECT_EQ(parseFeedLine("today please"), std::nullopt);
  EXPECT_EQ(parseFeedLine("JOIN 1"), std::nullopt);
  EXPECT_EQ(parseFeedLine("dance"), std::nullopt);
}
