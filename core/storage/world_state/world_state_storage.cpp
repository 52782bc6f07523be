/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/world_state/world_state_storage.hpp"

namespace trielog::storage {

  WorldStateStorage::WorldStateStorage(std::shared_ptr<SpacedStorage> storage,
                                       DataStorageFormat format)
      : storage_{std::move(storage)},
        format_{format},
        logger_{log::createLogger("WorldStateStorage", "storage")} {
    BOOST_ASSERT(storage_ != nullptr);
    trie_logs_ = storage_->getSpace(Space::kTrieLog);
    BOOST_ASSERT(trie_logs_ != nullptr);
  }

  outcome::result<std::optional<Buffer>> WorldStateStorage::getTrieLog(
      const primitives::BlockHash &block_hash) const {
    OUTCOME_TRY(value, trie_logs_->tryGet(block_hash));
    if (not value) {
      return std::nullopt;
    }
    return std::make_optional(value->intoBuffer());
  }

  outcome::result<void> WorldStateStorage::putTrieLog(
      const primitives::BlockHash &block_hash, BufferView trie_log) {
    SL_TRACE(logger_,
             "Put trie log of block {} ({} bytes)",
             block_hash,
             trie_log.size());
    return trie_logs_->put(block_hash, Buffer(trie_log));
  }

  std::unique_ptr<BufferStorageCursor> WorldStateStorage::trieLogCursor()
      const {
    return trie_logs_->cursor();
  }

  std::unique_ptr<BufferBatch> WorldStateStorage::trieLogBatch() {
    return trie_logs_->batch();
  }

}  // namespace trielog::storage
