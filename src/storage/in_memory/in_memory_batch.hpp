/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <string>

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"

namespace tally::storage {

  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<void> put(const ByteView &key,
                              ByteVecOrView &&value) override {
      entries[key.toHex()] = std::move(value).intoByteVec();
      return outcome::success();
    }

    outcome::result<void> remove(const ByteView &key) override {
      entries[key.toHex()] = std::nullopt;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[hex_key, value] : entries) {
        auto key = ByteVec::fromHex(hex_key).value();
        if (value.has_value()) {
          OUTCOME_TRY(db.put(key, ByteView{value.value()}));
        } else {
          OUTCOME_TRY(db.remove(key));
        }
      }
      return outcome::success();
    }

    void clear() override {
      entries.clear();
    }

   private:
    // std::nullopt marks a removal
    std::map<std::string, std::optional<ByteVec>> entries;
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db;
  };

}  // namespace tally::storage
