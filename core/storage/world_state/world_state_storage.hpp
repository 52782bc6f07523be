/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "common/buffer.hpp"
#include "log/logger.hpp"
#include "primitives/common.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/data_storage_configuration.hpp"
#include "storage/spaced_storage.hpp"

namespace trielog::storage {

  /**
   * Handle to the world state part of the node database. Knows the format
   * the state is kept in and gives access to the per-block trie logs.
   */
  class WorldStateStorage {
   public:
    WorldStateStorage(std::shared_ptr<SpacedStorage> storage,
                      DataStorageFormat format);

    DataStorageFormat dataStorageFormat() const {
      return format_;
    }

    outcome::result<std::optional<Buffer>> getTrieLog(
        const primitives::BlockHash &block_hash) const;

    /// Stores the trie log of a block, replacing any previous one
    outcome::result<void> putTrieLog(const primitives::BlockHash &block_hash,
                                     BufferView trie_log);

    /// Cursor over the trie log space in key order
    std::unique_ptr<BufferStorageCursor> trieLogCursor() const;

    /// Removals collected here are applied by commit()
    std::unique_ptr<BufferBatch> trieLogBatch();

   private:
    std::shared_ptr<SpacedStorage> storage_;
    std::shared_ptr<BufferStorage> trie_logs_;
    DataStorageFormat format_;
    log::Logger logger_;
  };

}  // namespace trielog::storage
