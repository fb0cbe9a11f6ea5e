/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/outcome.hpp>

namespace tally::report {

  /**
   * Destination of rendered reports.
   */
  class ReportSink {
   public:
    virtual ~ReportSink() = default;

    /**
     * @return error if the report was not delivered
     */
    virtual outcome::result<void> deliver(std::string_view content) = 0;
  };

}  // namespace tally::report
