/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

#include "storage/buffer_map_types.hpp"

namespace tally::storage {

  /**
   * Map kept entirely in memory. Used in tests in place of a RocksDB column.
   */
  class InMemoryStorage : public BufferStorage {
   public:
    /// Combines the stored value (if any) with a merge operand
    using MergeRule = std::function<outcome::result<ByteVec>(
        std::optional<ByteView> existing, ByteView operand)>;

    InMemoryStorage() = default;

    explicit InMemoryStorage(MergeRule merge_rule);

    ~InMemoryStorage() override = default;

    [[nodiscard]] outcome::result<ByteVecOrView> get(
        const ByteView &key) const override;

    [[nodiscard]] outcome::result<std::optional<ByteVecOrView>> tryGet(
        const ByteView &key) const override;

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override;

    outcome::result<void> merge(const ByteView &key,
                                ByteVecOrView &&operand) override;

    [[nodiscard]] outcome::result<bool> contains(
        const ByteView &key) const override;

    outcome::result<void> remove(const ByteView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    std::unique_ptr<Cursor> cursor() override;

    [[nodiscard]] std::optional<size_t> byteSizeHint() const override;

    /// Empty if the storage does not support merge
    const MergeRule &mergeRule() const {
      return merge_rule_;
    }

   private:
    // keys are hex encoded so that map order equals byte order
    std::map<std::string, ByteVec> storage_;
    size_t size_ = 0;
    MergeRule merge_rule_;

    friend class InMemoryCursor;
  };

}  // namespace tally::storage
