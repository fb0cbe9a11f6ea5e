/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/merge_operator.h>

namespace tally::storage {

  /**
   * Associative merge operator of counter column families. Adds the operand
   * to the stored counter within RocksDB, so increments of the same key
   * never race.
   */
  class CounterMergeOperator : public rocksdb::AssociativeMergeOperator {
   public:
    bool Merge(const rocksdb::Slice &key,
               const rocksdb::Slice *existing_value,
               const rocksdb::Slice &value,
               std::string *new_value,
               rocksdb::Logger *logger) const override;

    const char *Name() const override {
      return "TallyCounterMergeOperator";
    }
  };

}  // namespace tally::storage
