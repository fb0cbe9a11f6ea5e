/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/feed_command.hpp"

#include <span>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace tally::app {

  std::optional<FeedCommand> parseFeedLine(std::string_view line) {
    auto text = boost::trim_copy(std::string{line});
    if (text.empty() or text.front() == '#') {
      return std::nullopt;
    }

    std::vector<std::string> words;
    boost::split(
        words, text, boost::is_any_of(" \t"), boost::token_compress_on);

    const auto &verb = words.front();
    auto args = std::span{words}.subspan(1);

    if (verb == "snapshot") {
      return feed::Snapshot{{args.begin(), args.end()}};
    }
    if (verb == "join" or verb == "leave") {
      if (args.size() != 1) {
        return std::nullopt;
      }
      if (verb == "join") {
        return feed::Join{args.front()};
      }
      return feed::Leave{args.front()};
    }
    if (not args.empty()) {
      return std::nullopt;
    }
    if (verb == "today") {
      return feed::Today{};
    }
    if (verb == "report-now") {
      return feed::ReportNow{};
    }
    if (verb == "status") {
      return feed::Status{};
    }
    if (verb == "quit") {
      return feed::Quit{};
    }
    return std::nullopt;
  }

}  // namespace tally::app
