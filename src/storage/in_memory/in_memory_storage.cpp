/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <boost/assert.hpp>

#include "storage/in_memory/cursor.hpp"
#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

namespace tally::storage {

  InMemoryStorage::InMemoryStorage(MergeRule merge_rule)
      : merge_rule_(std::move(merge_rule)) {}

  outcome::result<ByteVecOrView> InMemoryStorage::get(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return ByteView{it->second};
    }
    return StorageError::NOT_FOUND;
  }

  outcome::result<std::optional<ByteVecOrView>> InMemoryStorage::tryGet(
      const ByteView &key) const {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      return ByteView{it->second};
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const ByteView &key,
                                             ByteVecOrView &&value) {
    auto hex_key = key.toHex();
    if (auto it = storage_.find(hex_key); it != storage_.end()) {
      BOOST_ASSERT(size_ >= it->second.size());
      size_ -= it->second.size();
    }
    size_ += value.size();
    storage_[hex_key] = std::move(value).intoByteVec();
    return outcome::success();
  }

  outcome::result<void> InMemoryStorage::merge(const ByteView &key,
                                               ByteVecOrView &&operand) {
    if (not merge_rule_) {
      return StorageError::NOT_SUPPORTED;
    }
    std::optional<ByteView> existing;
    auto it = storage_.find(key.toHex());
    if (it != storage_.end()) {
      existing.emplace(it->second);
    }
    OUTCOME_TRY(merged, merge_rule_(existing, operand.view()));
    return put(key, std::move(merged));
  }

  outcome::result<bool> InMemoryStorage::contains(const ByteView &key) const {
    return storage_.contains(key.toHex());
  }

  outcome::result<void> InMemoryStorage::remove(const ByteView &key) {
    if (auto it = storage_.find(key.toHex()); it != storage_.end()) {
      size_ -= it->second.size();
      storage_.erase(it);
    }
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  std::unique_ptr<InMemoryStorage::Cursor> InMemoryStorage::cursor() {
    return std::make_unique<InMemoryCursor>(*this);
  }

  std::optional<size_t> InMemoryStorage::byteSizeHint() const {
    return size_;
  }

}  // namespace tally::storage
