/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "common/buffer.hpp"
#include "filesystem/common.hpp"
#include "primitives/common.hpp"

namespace trielog::storage::trie_log {

  inline constexpr std::string_view kPruneCheckpointFileName =
      "trie-log-prune.checkpoint";

  /**
   * Progress of an interrupted prune. Valid only for the same chain head and
   * retention threshold it was recorded with.
   */
  struct PruneCheckpoint {
    primitives::BlockHash head;
    uint64_t retention = 0;
    /// last trie log key handled by a committed batch
    common::Buffer last_key;

    bool operator==(const PruneCheckpoint &other) const = default;

    /// head | retention u64 big-endian | last key
    common::Buffer encode() const;

    static outcome::result<PruneCheckpoint> decode(common::BufferView bytes);
  };

  filesystem::path pruneCheckpointPath(const filesystem::path &data_dir);

  /**
   * @return checkpoint stored in the data dir, or std::nullopt if there is
   * none
   */
  outcome::result<std::optional<PruneCheckpoint>> loadPruneCheckpoint(
      const filesystem::path &data_dir);

  /// Replaces the stored checkpoint atomically
  outcome::result<void> savePruneCheckpoint(
      const filesystem::path &data_dir, const PruneCheckpoint &checkpoint);

  /// Removing an absent checkpoint is not an error
  outcome::result<void> removePruneCheckpoint(
      const filesystem::path &data_dir);

}  // namespace trielog::storage::trie_log
