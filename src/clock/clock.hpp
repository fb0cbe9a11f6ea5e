/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace tally::clock {

  /**
   * An interface for a clock
   * @tparam clock type is an underlying clock type, such as std::system_clock
   */
  template <typename ClockType>
  class Clock {
   public:
    /**
     * Difference between two time points
     */
    using Duration = typename ClockType::duration;

    /**
     * A moment in time
     */
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    /**
     * @return a time point representing the current time
     */
    [[nodiscard]] virtual TimePoint now() const = 0;

    /**
     * @return number of seconds since the beginning of epoch (Jan 1, 1970)
     */
    [[nodiscard]] virtual uint64_t nowSec() const = 0;

    /**
     * @return number of milliseconds since the beginning of epoch
     */
    [[nodiscard]] virtual std::chrono::milliseconds nowMsec() const = 0;
  };

  /**
   * Wall clock. Every instant the tracker records or compares comes from here.
   */
  class SystemClock : public virtual Clock<std::chrono::system_clock> {
   public:
    /**
     * @return current UTC instant truncated to milliseconds
     */
    [[nodiscard]] std::chrono::sys_time<std::chrono::milliseconds>
    nowInstant() const {
      return std::chrono::sys_time<std::chrono::milliseconds>{nowMsec()};
    }
  };

}  // namespace tally::clock
