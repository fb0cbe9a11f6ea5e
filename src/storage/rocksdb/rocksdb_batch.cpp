/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "storage/storage_error.hpp"

namespace tally::storage {

  RocksDbBatch::RocksDbBatch(RocksDbSpace &db, log::Logger &logger)
      : db_(db), logger_(logger) {}

  outcome::result<void> RocksDbBatch::put(const ByteView &key,
                                          ByteVecOrView &&value) {
    auto status = batch_.Put(db_.column_, make_slice(key), make_slice(value));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::remove(const ByteView &key) {
    auto status = batch_.Delete(db_.column_, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbBatch::commit() {
    auto rocks = db_.storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (status.ok()) {
      return outcome::success();
    }

    return status_as_error(status, logger_);
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }

  RocksDbSpacedBatch::RocksDbSpacedBatch(std::weak_ptr<RocksDb> storage,
                                         log::Logger logger)
      : storage_(std::move(storage)), logger_(std::move(logger)) {}

  outcome::result<rocksdb::ColumnFamilyHandle *> RocksDbSpacedBatch::column(
      Space space) const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    auto handle = rocks->columnOf(space);
    if (handle == nullptr) {
      SL_ERROR(logger_, "No column family for space {}", spaceName(space));
      return StorageError::INVALID_ARGUMENT;
    }
    return handle;
  }

  outcome::result<void> RocksDbSpacedBatch::put(Space space,
                                                const ByteView &key,
                                                ByteVecOrView &&value) {
    OUTCOME_TRY(handle, column(space));
    auto status = batch_.Put(handle, make_slice(key), make_slice(value));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbSpacedBatch::merge(Space space,
                                                  const ByteView &key,
                                                  ByteVecOrView &&operand) {
    OUTCOME_TRY(handle, column(space));
    auto status = batch_.Merge(handle, make_slice(key), make_slice(operand));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbSpacedBatch::remove(Space space,
                                                   const ByteView &key) {
    OUTCOME_TRY(handle, column(space));
    auto status = batch_.Delete(handle, make_slice(key));
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  outcome::result<void> RocksDbSpacedBatch::commit() {
    auto rocks = storage_.lock();
    if (not rocks) {
      return StorageError::STORAGE_GONE;
    }
    auto status = rocks->db_->Write(rocks->wo_, &batch_);
    if (not status.ok()) {
      return status_as_error(status, logger_);
    }
    return outcome::success();
  }

  void RocksDbSpacedBatch::clear() {
    batch_.Clear();
  }
}  // namespace tally::storage
