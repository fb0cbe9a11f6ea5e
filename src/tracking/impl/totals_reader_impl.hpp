/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "tracking/local_calendar.hpp"
#include "tracking/presence_store.hpp"
#include "tracking/totals_reader.hpp"

namespace tally::tracking {

  class TotalsReaderImpl final : public TotalsReader {
   public:
    TotalsReaderImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<PresenceStore> store,
                     qtils::SharedRef<LocalCalendar> calendar);

    outcome::result<Totals> getTotalsForDay(const DayKey &day_key,
                                            bool include_live,
                                            Instant now) const override;

   private:
    log::Logger logger_;
    qtils::SharedRef<PresenceStore> store_;
    qtils::SharedRef<LocalCalendar> calendar_;
  };

}  // namespace tally::tracking
