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
#include <utility>
#include <vector>

#include <qtils/byte_vec.hpp>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_batch.hpp"
#include "storage/storage_error.hpp"

namespace tally::storage {

  /**
   * Cross-space batch of InMemorySpacedStorage. Commit computes every
   * resulting value first, so a failing merge leaves all spaces untouched.
   */
  class InMemorySpacedBatch : public SpacedBatch {
   public:
    using SpaceOf = std::function<std::shared_ptr<InMemoryStorage>(Space)>;

    explicit InMemorySpacedBatch(SpaceOf space_of)
        : space_of_{std::move(space_of)} {}

    outcome::result<void> put(Space space,
                              const ByteView &key,
                              ByteVecOrView &&value) override {
      ops_.push_back(Op{.kind = Op::Put,
                        .space = space,
                        .key = ByteVec(key.begin(), key.end()),
                        .value = std::move(value).intoByteVec()});
      return outcome::success();
    }

    outcome::result<void> merge(Space space,
                                const ByteView &key,
                                ByteVecOrView &&operand) override {
      ops_.push_back(Op{.kind = Op::Merge,
                        .space = space,
                        .key = ByteVec(key.begin(), key.end()),
                        .value = std::move(operand).intoByteVec()});
      return outcome::success();
    }

    outcome::result<void> remove(Space space, const ByteView &key) override {
      ops_.push_back(Op{.kind = Op::Remove,
                        .space = space,
                        .key = ByteVec(key.begin(), key.end()),
                        .value = {}});
      return outcome::success();
    }

    outcome::result<void> commit() override {
      // (space, hex key) -> resulting value, std::nullopt marks a removal
      std::map<std::pair<Space, std::string>, std::optional<ByteVec>> staged;
      for (auto &op : ops_) {
        auto slot = std::make_pair(op.space, ByteView{op.key}.toHex());
        switch (op.kind) {
          case Op::Put:
            staged[slot] = op.value;
            break;
          case Op::Remove:
            staged[slot] = std::nullopt;
            break;
          case Op::Merge: {
            auto storage = space_of_(op.space);
            const auto &rule = storage->mergeRule();
            if (not rule) {
              return StorageError::NOT_SUPPORTED;
            }
            std::optional<ByteVec> existing;
            if (auto it = staged.find(slot); it != staged.end()) {
              existing = it->second;
            } else {
              OUTCOME_TRY(stored, storage->tryGet(op.key));
              if (stored.has_value()) {
                existing = std::move(stored.value()).intoByteVec();
              }
            }
            std::optional<ByteView> existing_view;
            if (existing.has_value()) {
              existing_view.emplace(existing.value());
            }
            OUTCOME_TRY(merged, rule(existing_view, ByteView{op.value}));
            staged[slot] = std::move(merged);
            break;
          }
        }
      }

      for (auto &[slot, value] : staged) {
        auto storage = space_of_(slot.first);
        auto key = ByteVec::fromHex(slot.second).value();
        if (value.has_value()) {
          OUTCOME_TRY(storage->put(key, std::move(value.value())));
        } else {
          OUTCOME_TRY(storage->remove(key));
        }
      }
      ops_.clear();
      return outcome::success();
    }

    void clear() override {
      ops_.clear();
    }

   private:
    struct Op {
      enum Kind { Put, Merge, Remove } kind;
      Space space;
      ByteVec key;
      ByteVec value;
    };

    SpaceOf space_of_;
    std::vector<Op> ops_;
  };

}  // namespace tally::storage
