/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_cursor.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace tally::storage {

  RocksDBCursor::RocksDBCursor(std::unique_ptr<rocksdb::Iterator> it)
      : i_{std::move(it)} {}

  outcome::result<bool> RocksDBCursor::seekFirst() {
    i_->SeekToFirst();
    return checkedValid();
  }

  outcome::result<bool> RocksDBCursor::seek(const ByteView &key) {
    i_->Seek(make_slice(key));
    return checkedValid();
  }

  outcome::result<bool> RocksDBCursor::seekLast() {
    i_->SeekToLast();
    return checkedValid();
  }

  bool RocksDBCursor::isValid() const {
    return i_->Valid();
  }

  outcome::result<void> RocksDBCursor::next() {
    if (isValid()) {
      i_->Next();
    }
    OUTCOME_TRY(checkedValid());
    return outcome::success();
  }

  outcome::result<void> RocksDBCursor::prev() {
    if (isValid()) {
      i_->Prev();
    }
    OUTCOME_TRY(checkedValid());
    return outcome::success();
  }

  std::optional<ByteVec> RocksDBCursor::key() const {
    return isValid() ? std::make_optional(make_buffer(i_->key()))
                     : std::nullopt;
  }

  std::optional<ByteVecOrView> RocksDBCursor::value() const {
    return isValid() ? std::make_optional<ByteVecOrView>(
                           make_buffer(i_->value()))
                     : std::nullopt;
  }

  outcome::result<bool> RocksDBCursor::checkedValid() const {
    if (not i_->status().ok()) {
      return StorageError::IO_ERROR;
    }
    return i_->Valid();
  }

}  // namespace tally::storage
