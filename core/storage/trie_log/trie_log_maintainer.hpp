/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <unordered_set>
#include <vector>

#include "blockchain/blockchain.hpp"
#include "filesystem/common.hpp"
#include "log/logger.hpp"
#include "storage/data_storage_configuration.hpp"
#include "storage/world_state/world_state_storage.hpp"

namespace trielog::storage::trie_log {

  /// Trie logs grouped by the relation of their block to the canonical chain
  struct TrieLogCount {
    uint64_t total = 0;
    /// block is on the canonical chain
    uint64_t canonical = 0;
    /// header is known, but another block is canonical at its height
    uint64_t fork = 0;
    /// no header is known for the block
    uint64_t orphaned = 0;

    bool operator==(const TrieLogCount &other) const = default;
  };

  struct PruneStats {
    uint64_t retained = 0;
    uint64_t pruned = 0;

    bool operator==(const PruneStats &other) const = default;
  };

  /**
   * Maintenance of the per-block trie logs of a BONSAI world state.
   * Every operation fails with
   * TrieLogPreconditionError::UNSUPPORTED_STORAGE_FORMAT before touching the
   * storage when the world state is kept in another format.
   */
  class TrieLogMaintainer {
   public:
    TrieLogMaintainer(DataStorageConfiguration config,
                      std::shared_ptr<WorldStateStorage> storage,
                      std::shared_ptr<const blockchain::Blockchain> blockchain);

    /**
     * Classifies at most limit trie logs in key order. Read-only.
     */
    outcome::result<TrieLogCount> count(size_t limit) const;

    /**
     * Keeps the trie logs of the canonical blocks in
     * [head - retention, head] and removes all the others.
     * Progress is checkpointed into data_dir after every committed batch, so
     * an interrupted run continues where it stopped.
     */
    outcome::result<PruneStats> prune(const filesystem::path &data_dir);

    /**
     * Writes the trie logs of the given blocks to a file, in the given order.
     * Blocks without a trie log are skipped.
     * @return number of written trie logs
     */
    outcome::result<size_t> exportTrieLog(
        const std::vector<primitives::BlockHash> &block_hashes,
        const filesystem::path &path) const;

    /**
     * Puts every trie log of the file into the storage, overwriting existing
     * ones. Trie logs read before a malformed frame stay imported.
     * @return number of imported trie logs
     */
    outcome::result<size_t> importTrieLog(const filesystem::path &path);

   private:
    enum class BlockKind : uint8_t { CANONICAL, FORK, ORPHANED };

    outcome::result<void> checkFormat() const;

    outcome::result<BlockKind> classify(common::BufferView key) const;

    outcome::result<std::unordered_set<primitives::BlockHash>>
    canonicalHashes(primitives::BlockNumber from,
                    primitives::BlockNumber to) const;

    DataStorageConfiguration config_;
    std::shared_ptr<WorldStateStorage> storage_;
    std::shared_ptr<const blockchain::Blockchain> blockchain_;
    log::Logger logger_;
  };

}  // namespace trielog::storage::trie_log
