/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/database_error.hpp"
#include "storage/in_memory/cursor.hpp"
#include "storage/in_memory/in_memory_batch.hpp"

namespace trielog::storage {

  outcome::result<BufferOrView> InMemoryStorage::get(
      const BufferView &key) const {
    if (auto it = storage_.find(key); it != storage_.end()) {
      return BufferView{it->second};
    }
    return DatabaseError::NOT_FOUND;
  }

  outcome::result<std::optional<BufferOrView>> InMemoryStorage::tryGet(
      const BufferView &key) const {
    if (auto it = storage_.find(key); it != storage_.end()) {
      return std::make_optional<BufferOrView>(BufferView{it->second});
    }
    return std::nullopt;
  }

  outcome::result<void> InMemoryStorage::put(const BufferView &key,
                                             BufferOrView &&value) {
    storage_.insert_or_assign(Buffer{key}, value.intoBuffer());
    return outcome::success();
  }

  outcome::result<bool> InMemoryStorage::contains(const BufferView &key) const {
    return storage_.find(key) != storage_.end();
  }

  bool InMemoryStorage::empty() const {
    return storage_.empty();
  }

  size_t InMemoryStorage::size() const {
    return storage_.size();
  }

  outcome::result<void> InMemoryStorage::remove(const BufferView &key) {
    if (auto it = storage_.find(key); it != storage_.end()) {
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
}  // namespace trielog::storage
