/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/counter_merge.hpp"

#include <limits>

#include "serde/serialization.hpp"
#include "storage/storage_error.hpp"

namespace tally::storage {

  qtils::ByteVec encodeCounter(uint64_t value) {
    // uint64 is fixed size, encoding cannot fail
    return encode(value).value();
  }

  outcome::result<uint64_t> decodeCounter(qtils::ByteView bytes) {
    if (bytes.size() != kCounterSize) {
      return StorageError::CORRUPTION;
    }
    auto value = decode<uint64_t>(bytes);
    if (value.has_error()) {
      return StorageError::CORRUPTION;
    }
    return value.value();
  }

  outcome::result<qtils::ByteVec> mergeCounters(
      std::optional<qtils::ByteView> existing, qtils::ByteView operand) {
    uint64_t base = 0;
    if (existing.has_value()) {
      OUTCOME_TRY(stored, decodeCounter(existing.value()));
      base = stored;
    }
    OUTCOME_TRY(delta, decodeCounter(operand));
    if (delta > std::numeric_limits<uint64_t>::max() - base) {
      return encodeCounter(std::numeric_limits<uint64_t>::max());
    }
    return encodeCounter(base + delta);
  }

}  // namespace tally::storage
