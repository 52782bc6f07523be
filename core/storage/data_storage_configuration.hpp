/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace trielog::storage {

  /// Layout of the world state in the database
  enum class DataStorageFormat : uint8_t {
    /// Plain key-value trie nodes, no per-block trie logs
    FOREST,

    /// Flat layered state with a trie log per block
    BONSAI,
  };

  std::string_view dataStorageFormatName(DataStorageFormat format);

  std::optional<DataStorageFormat> dataStorageFormatFromName(
      std::string_view name);

  struct DataStorageConfiguration {
    static constexpr uint64_t kDefaultTrieLogRetention = 512;
    static constexpr uint32_t kDefaultTrieLogPruneBatchSize = 1000;

    DataStorageFormat format = DataStorageFormat::BONSAI;

    /// Number of most recent canonical blocks whose trie logs are kept
    uint64_t trie_log_retention = kDefaultTrieLogRetention;

    /// Deletions applied per committed write batch while pruning
    uint32_t trie_log_prune_batch_size = kDefaultTrieLogPruneBatchSize;
  };

}  // namespace trielog::storage
