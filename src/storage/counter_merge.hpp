/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>

#include <qtils/byte_vec.hpp>
#include <qtils/outcome.hpp>

namespace tally::storage {

  /**
   * Counters are stored as 8 bytes little-endian unsigned integers, the SSZ
   * encoding of uint64.
   */
  constexpr size_t kCounterSize = sizeof(uint64_t);

  qtils::ByteVec encodeCounter(uint64_t value);

  /**
   * @return StorageError::CORRUPTION if `bytes` is not a counter
   */
  outcome::result<uint64_t> decodeCounter(qtils::ByteView bytes);

  /**
   * Merge rule of counter spaces: the stored counter (zero when absent) plus
   * the operand counter. The sum saturates at UINT64_MAX.
   * @return StorageError::CORRUPTION if either side is malformed
   */
  outcome::result<qtils::ByteVec> mergeCounters(
      std::optional<qtils::ByteView> existing, qtils::ByteView operand);

}  // namespace tally::storage
