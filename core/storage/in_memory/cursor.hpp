/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace trielog::storage {
  /**
   * Cursor keeps a copy of the current entry, so the map may be modified
   * between steps: next() continues after the last seen key.
   */
  class InMemoryCursor : public BufferStorageCursor {
   public:
    explicit InMemoryCursor(InMemoryStorage &db) : db_{db} {}

    outcome::result<bool> seekFirst() override {
      return seek(db_.storage_.begin());
    }

    outcome::result<bool> seekLowerBound(const BufferView &key) override {
      return seek(db_.storage_.lower_bound(key));
    }

    bool isValid() const override {
      return kv_.has_value();
    }

    outcome::result<void> next() override {
      if (kv_) {
        seek(db_.storage_.upper_bound(kv_->first));
      }
      return outcome::success();
    }

    std::optional<Buffer> key() const override {
      if (kv_) {
        return kv_->first;
      }
      return std::nullopt;
    }

    std::optional<BufferOrView> value() const override {
      if (kv_) {
        return BufferView{kv_->second};
      }
      return std::nullopt;
    }

   private:
    bool seek(decltype(InMemoryStorage::storage_)::iterator it) {
      if (it == db_.storage_.end()) {
        kv_.reset();
      } else {
        kv_.emplace(it->first, it->second);
      }
      return isValid();
    }

    // NOLINTNEXTLINE(cppcoreguidelines-avoid-const-or-ref-data-members)
    InMemoryStorage &db_;
    std::optional<std::pair<Buffer, Buffer>> kv_;
  };
}  // namespace trielog::storage
