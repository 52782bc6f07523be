/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "common/buffer.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace trielog::storage {

  /// Collects puts and removes in order and applies them on commit
  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db_{db} {}

    outcome::result<void> put(const BufferView &key,
                              BufferOrView &&value) override {
      entries_.emplace_back(Buffer{key}, value.intoBuffer());
      return outcome::success();
    }

    outcome::result<void> remove(const BufferView &key) override {
      entries_.emplace_back(Buffer{key}, std::nullopt);
      return outcome::success();
    }

    outcome::result<void> commit() override {
      for (auto &[key, value] : entries_) {
        if (value) {
          OUTCOME_TRY(db_.put(key, std::move(*value)));
        } else {
          OUTCOME_TRY(db_.remove(key));
        }
      }
      entries_.clear();
      return outcome::success();
    }

    size_t size() const override {
      return entries_.size();
    }

    void clear() override {
      entries_.clear();
    }

   private:
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db_;
    std::vector<std::pair<Buffer, std::optional<Buffer>>> entries_;
  };
}  // namespace trielog::storage
