/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_counter_merge.hpp"

#include <optional>

#include <qtils/byte_vec.hpp>

#include "storage/counter_merge.hpp"

namespace tally::storage {

  namespace {
    qtils::ByteView asBytes(const rocksdb::Slice &s) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return {reinterpret_cast<const uint8_t *>(s.data()), s.size()};
    }
  }  // namespace

  bool CounterMergeOperator::Merge(const rocksdb::Slice &,
                                   const rocksdb::Slice *existing_value,
                                   const rocksdb::Slice &value,
                                   std::string *new_value,
                                   rocksdb::Logger *logger) const {
    std::optional<qtils::ByteView> existing;
    if (existing_value != nullptr) {
      existing.emplace(asBytes(*existing_value));
    }
    auto merged = mergeCounters(existing, asBytes(value));
    if (merged.has_error()) {
      // RocksDB reports the failed merge as corruption to the reader
      rocksdb::Log(logger,
                   "Malformed counter in merge: %s",
                   merged.error().message().c_str());
      return false;
    }
    const auto &bytes = merged.value();
    new_value->assign(bytes.begin(), bytes.end());
    return true;
  }

}  // namespace tally::storage
