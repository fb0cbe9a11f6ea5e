/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <algorithm>
#include <climits>
#include <iterator>
#include <ranges>
#include <unordered_set>

#include <app/configuration.hpp>
#include <qtils/error_throw.hpp>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>
#include <soralog/macro.hpp>

#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_counter_merge.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"
#include "utils/fd_limit.hpp"

namespace tally::storage {
  namespace fs = std::filesystem;

  namespace {
    rocksdb::ColumnFamilyOptions configureColumn(const std::string &name,
                                                 uint64_t memory_budget) {
      rocksdb::ColumnFamilyOptions options;
      options.OptimizeLevelStyleCompaction(memory_budget);
      auto table_options = RocksDb::tableOptionsConfiguration();
      options.table_factory.reset(NewBlockBasedTableFactory(table_options));
      if (name == spaceName(Space::DailyTotals)) {
        options.merge_operator = std::make_shared<CounterMergeOperator>();
      }
      return options;
    }

    template <std::ranges::range ColumnFamilyNames>
    std::vector<rocksdb::ColumnFamilyDescriptor> configureColumnFamilies(
        const ColumnFamilyNames &cf_names,
        uint64_t memory_budget,
        log::Logger &log) {
      std::vector<rocksdb::ColumnFamilyDescriptor> descriptors;
      const uint64_t per_space_budget =
          cf_names.empty() ? 0 : memory_budget / cf_names.size();
      for (const auto &space_name : cf_names) {
        descriptors.emplace_back(space_name,
                                 configureColumn(space_name, per_space_budget));
        SL_DEBUG(log,
                 "Column family '{}' configured with cache_size={:.0f}Mb",
                 space_name,
                 static_cast<double>(per_space_budget) / 1024.0 / 1024.0);
      }
      return descriptors;
    }
  }  // namespace

  RocksDb::RocksDb(qtils::SharedRef<log::LoggingSystem> logsys,
                   qtils::SharedRef<app::Configuration> app_config)
      : logger_(logsys->getLogger("RocksDB", "storage")) {
    ro_.fill_cache = false;
    wo_.sync = true;

    const auto &path = app_config->database().directory;

    auto options = rocksdb::Options{};
    options.create_if_missing = true;
    options.create_missing_column_families = true;
    options.optimize_filters_for_hits = true;
    options.table_factory.reset(rocksdb::NewBlockBasedTableFactory(
        storage::RocksDb::tableOptionsConfiguration()));

    // Setting limit for open rocksdb files to a half of system soft limit
    auto soft_limit = getFdSoftLimit(logger_);
    if (not soft_limit) {
      SL_CRITICAL(logger_, "Call getrlimit(RLIMIT_NOFILE) was failed");
      qtils::raise(StorageError::UNKNOWN);
    }
    // -1 keeps all files open
    options.max_open_files = soft_limit.value() / 2 > INT_MAX
                               ? -1
                               : static_cast<int>(soft_limit.value() / 2);

    if (auto res = createDirectory(path, logger_); res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't create DB directory {}: {}",
                  path.native(),
                  res.error().message());
      qtils::raise(res.error());
    }

    std::vector<std::string> existing_families;
    auto res = rocksdb::DB::ListColumnFamilies(
        options, path.native(), &existing_families);
    if (not res.ok() and not res.IsPathNotFound() and not res.IsIOError()) {
      SL_ERROR(logger_,
               "Can't list column families in {}: {}",
               path.native(),
               res.ToString());
      qtils::raise(status_as_error(res, logger_));
    }

    // Required spaces first so that handles are in Space order
    std::vector<std::string> all_families;
    std::unordered_set<std::string> known;
    for (size_t i = 0; i < SpacesCount; ++i) {
      all_families.emplace_back(spaceName(static_cast<Space>(i)));
      known.insert(all_families.back());
    }
    for (auto &existing_family : existing_families) {
      if (known.insert(existing_family).second) {
        SL_WARN(logger_,
                "Column family '{}' present in database but not used by "
                "Tally; Probably obsolete.",
                existing_family);
        all_families.emplace_back(existing_family);
      }
    }

    auto column_family_descriptors = configureColumnFamilies(
        all_families, app_config->database().cache_size, logger_);

    qtils::raise_on_err(openDatabase(
        options, path, column_family_descriptors, *this, logger_));

    SL_VERBOSE(logger_, "Database opened in {}", path.native());
  }

  RocksDb::~RocksDb() {
    for (auto *handle : column_family_handles_) {
      auto status = db_->DestroyColumnFamilyHandle(handle);
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't destroy column family handle: {}",
                 status.ToString());
      }
    }
    delete db_;
  }

  outcome::result<void> RocksDb::createDirectory(
      const std::filesystem::path &absolute_path, log::Logger &log) {
    std::error_code ec;
    if (not fs::create_directories(absolute_path, ec) and ec.value()) {
      SL_ERROR(log,
               "Can't create directory {} for database: {}",
               absolute_path.native(),
               ec.message());
      return StorageError::DB_PATH_NOT_CREATED;
    }
    if (not fs::is_directory(absolute_path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path.native());
      return StorageError::DB_PATH_NOT_CREATED;
    }
    return outcome::success();
  }

  outcome::result<void> RocksDb::openDatabase(
      const rocksdb::Options &options,
      const std::filesystem::path &path,
      const std::vector<rocksdb::ColumnFamilyDescriptor>
          &column_family_descriptors,
      RocksDb &rocks_db,
      log::Logger &log) {
    const auto status = rocksdb::DB::Open(options,
                                          path.native(),
                                          column_family_descriptors,
                                          &rocks_db.column_family_handles_,
                                          &rocks_db.db_);
    if (not status.ok()) {
      SL_ERROR(log,
               "Can't open database in {}: {}",
               path.native(),
               status.ToString());
      return status_as_error(status, log);
    }
    return outcome::success();
  }

  RocksDb::ColumnFamilyHandlePtr RocksDb::columnOf(Space space) const {
    auto space_name = spaceName(space);
    auto column = std::ranges::find_if(
        column_family_handles_,
        [&space_name](const ColumnFamilyHandlePtr &handle) {
          return handle->GetName() == space_name;
        });
    return column == column_family_handles_.end() ? nullptr : *column;
  }

  std::unique_ptr<SpacedBatch> RocksDb::createBatch() {
    return std::make_unique<RocksDbSpacedBatch>(weak_from_this(), logger_);
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    if (auto it = spaces_.find(space); it != spaces_.end()) {
      return it->second;
    }
    auto space_name = spaceName(space);
    auto column = std::ranges::find_if(
        column_family_handles_,
        [&space_name](const ColumnFamilyHandlePtr &handle) {
          return handle->GetName() == space_name;
        });
    if (column_family_handles_.end() == column) {
      qtils::raise(StorageError::INVALID_ARGUMENT);
    }
    auto space_ptr =
        std::make_shared<RocksDbSpace>(weak_from_this(), *column, logger_);
    spaces_[space] = space_ptr;
    return space_ptr;
  }

  rocksdb::BlockBasedTableOptions RocksDb::tableOptionsConfiguration(
      uint32_t lru_cache_size_mib, uint32_t block_size_kib) {
    rocksdb::BlockBasedTableOptions table_options;
    table_options.format_version = 5;
    table_options.block_cache = rocksdb::NewLRUCache(
        static_cast<uint64_t>(lru_cache_size_mib) * 1024 * 1024);
    table_options.block_size = static_cast<size_t>(block_size_kib) * 1024;
    table_options.cache_index_and_filter_blocks = true;
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10, false));
    return table_options;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             const RocksDb::ColumnFamilyHandlePtr &column,
                             log::Logger logger)
      : logger_{std::move(logger)},
        storage_{std::move(storage)},
        column_{column} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    return std::make_unique<RocksDbBatch>(*this, logger_);
  }

  std::optional<size_t> RocksDbSpace::byteSizeHint() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return 0;
    }
    uint64_t usage_bytes = 0;
    if (not rocks->db_->GetIntProperty(
            column_, "rocksdb.cur-size-all-mem-tables", &usage_bytes)) {
      SL_ERROR(logger_, "Unable to retrieve memory usage value");
      return std::nullopt;
    }
    return usage_bytes;
  }

  std::unique_ptr<RocksDbSpace::Cursor> RocksDbSpace::cursor() {
    auto rocks = storage_.lock();
    if (not rocks) {
      qtils::raise(StorageError::STORAGE_GONE);
    }
    auto it = std::unique_ptr<rocksdb::Iterator>(
        rocks->db_->NewIterator(rocks->ro_, column_));
    return std::make_unique<RocksDBCursor>(std::move(it));
  }

  outcome::result<bool> RocksDbSpace::contains(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    std::string value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return true;
    }

    if (status.IsNotFound()) {
      return false;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<ByteVecOrView> RocksDbSpace::get(const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    rocksdb::PinnableSlice value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return make_buffer(value);
    }
    return status_as_error(status, logger_);
  }

  outcome::result<std::optional<ByteVecOrView>> RocksDbSpace::tryGet(
      const ByteView &key) const {
    OUTCOME_TRY(rocks, use());
    rocksdb::PinnableSlice value;
    auto status = rocks->db_->Get(rocks->ro_, column_, make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional(ByteVecOrView(make_buffer(value)));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Put(
        rocks->wo_, column_, make_slice(key), make_slice(value));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::merge(const ByteView &key,
                                            ByteVecOrView &&operand) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Merge(
        rocks->wo_, column_, make_slice(key), make_slice(operand));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<void> RocksDbSpace::remove(const ByteView &key) {
    OUTCOME_TRY(rocks, use());
    auto status = rocks->db_->Delete(rocks->wo_, column_, make_slice(key));
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace tally::storage
