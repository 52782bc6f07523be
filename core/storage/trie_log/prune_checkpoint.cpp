/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/trie_log/prune_checkpoint.hpp"

#include <boost/endian/conversion.hpp>

#include "storage/trie_log/trie_log_error.hpp"
#include "utils/read_file.hpp"
#include "utils/write_file.hpp"

namespace trielog::storage::trie_log {

  namespace {
    constexpr size_t kFixedPartSize =
        primitives::BlockHash::size() + sizeof(uint64_t);
  }  // namespace

  common::Buffer PruneCheckpoint::encode() const {
    common::Buffer out;
    out.reserve(kFixedPartSize + last_key.size());
    out.put(head);
    out.putUint64(retention);
    out.put(last_key.view());
    return out;
  }

  outcome::result<PruneCheckpoint> PruneCheckpoint::decode(
      common::BufferView bytes) {
    if (bytes.size() < kFixedPartSize) {
      return TrieLogPruneError::CORRUPTED_CHECKPOINT;
    }
    PruneCheckpoint checkpoint;
    OUTCOME_TRY(head,
                primitives::BlockHash::fromSpan(
                    bytes.first(primitives::BlockHash::size())));
    checkpoint.head = head;
    bytes.dropFirst(primitives::BlockHash::size());
    checkpoint.retention =
        boost::endian::load_big_u64(bytes.first(sizeof(uint64_t)).data());
    bytes.dropFirst(sizeof(uint64_t));
    checkpoint.last_key = common::Buffer(bytes);
    return checkpoint;
  }

  filesystem::path pruneCheckpointPath(const filesystem::path &data_dir) {
    return data_dir / kPruneCheckpointFileName;
  }

  outcome::result<std::optional<PruneCheckpoint>> loadPruneCheckpoint(
      const filesystem::path &data_dir) {
    auto path = pruneCheckpointPath(data_dir);
    std::error_code ec;
    if (not filesystem::exists(path, ec)) {
      return std::nullopt;
    }
    common::Buffer content;
    if (readFile(content, path).has_error()) {
      return TrieLogIoError::CANNOT_READ_FILE;
    }
    OUTCOME_TRY(checkpoint, PruneCheckpoint::decode(content));
    return checkpoint;
  }

  outcome::result<void> savePruneCheckpoint(
      const filesystem::path &data_dir, const PruneCheckpoint &checkpoint) {
    if (writeFileTmp(pruneCheckpointPath(data_dir), checkpoint.encode())
            .has_error()) {
      return TrieLogIoError::CANNOT_WRITE_FILE;
    }
    return outcome::success();
  }

  outcome::result<void> removePruneCheckpoint(
      const filesystem::path &data_dir) {
    std::error_code ec;
    filesystem::remove(pruneCheckpointPath(data_dir), ec);
    if (ec) {
      return TrieLogIoError::CANNOT_REMOVE_FILE;
    }
    return outcome::success();
  }

}  // namespace trielog::storage::trie_log
