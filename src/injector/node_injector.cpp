/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 32

#include "injector/node_injector.hpp"

#include <memory>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>
#include <qtils/error_throw.hpp>

#include "app/configuration.hpp"
#include "app/impl/application_impl.hpp"
#include "app/impl/command_processor.hpp"
#include "app/impl/event_loop.hpp"
#include "app/impl/midnight_scheduler.hpp"
#include "app/impl/presence_feed.hpp"
#include "app/impl/presence_tracker.hpp"
#include "app/impl/state_manager_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "log/logger.hpp"
#include "report/impl/console_report_sink.hpp"
#include "report/member_directory.hpp"
#include "report/reporter.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "tracking/impl/presence_store_impl.hpp"
#include "tracking/impl/session_engine_impl.hpp"
#include "tracking/impl/totals_reader_impl.hpp"
#include "tracking/local_calendar.hpp"

namespace {
  namespace di = boost::di;
  using namespace tally;  // NOLINT

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<app::StateManager>.to<app::StateManagerImpl>(),
        di::bind<app::Application>.to<app::ApplicationImpl>(),
        di::bind<clock::SystemClock>.to<clock::SystemClockImpl>(),
        di::bind<storage::SpacedStorage>.to<storage::RocksDb>(),
        di::bind<tracking::LocalCalendar>.to([](const auto &injector) {
          const auto &timezone = injector
              .template create<app::Configuration const &>()
              .tracking().timezone;
          auto calendar = tracking::LocalCalendar::create(timezone);
          qtils::raise_on_err(calendar);
          return std::make_shared<tracking::LocalCalendar>(
              std::move(calendar.value()));
        }),
        di::bind<tracking::PresenceStore>.to<tracking::PresenceStoreImpl>(),
        di::bind<tracking::SessionEngine>.to<tracking::SessionEngineImpl>(),
        di::bind<tracking::TotalsReader>.to<tracking::TotalsReaderImpl>(),
        di::bind<report::ReportSink>.to<report::ConsoleReportSink>(),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace tally::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::Application> NodeInjector::injectApplication() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::Application>>();
  }

}  // namespace tally::injector
