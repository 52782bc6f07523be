/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/trie_log/trie_log_maintainer.hpp"

#include "storage/trie_log/prune_checkpoint.hpp"
#include "storage/trie_log/trie_log_error.hpp"
#include "storage/trie_log/trie_log_file.hpp"

namespace trielog::storage::trie_log {

  TrieLogMaintainer::TrieLogMaintainer(
      DataStorageConfiguration config,
      std::shared_ptr<WorldStateStorage> storage,
      std::shared_ptr<const blockchain::Blockchain> blockchain)
      : config_{config},
        storage_{std::move(storage)},
        blockchain_{std::move(blockchain)},
        logger_{log::createLogger("TrieLogMaintainer", "trie_log")} {
    BOOST_ASSERT(storage_ != nullptr);
    BOOST_ASSERT(blockchain_ != nullptr);
    BOOST_ASSERT(config_.trie_log_prune_batch_size > 0);
  }

  outcome::result<void> TrieLogMaintainer::checkFormat() const {
    if (storage_->dataStorageFormat() != DataStorageFormat::BONSAI) {
      SL_ERROR(logger_,
               "Trie logs are not kept with data storage format {}",
               dataStorageFormatName(storage_->dataStorageFormat()));
      return TrieLogPreconditionError::UNSUPPORTED_STORAGE_FORMAT;
    }
    return outcome::success();
  }

  outcome::result<TrieLogMaintainer::BlockKind> TrieLogMaintainer::classify(
      common::BufferView key) const {
    if (key.size() != primitives::BlockHash::size()) {
      return BlockKind::ORPHANED;
    }
    OUTCOME_TRY(block_hash, primitives::BlockHash::fromSpan(key));
    OUTCOME_TRY(header_opt, blockchain_->blockHeader(block_hash));
    if (not header_opt) {
      return BlockKind::ORPHANED;
    }
    OUTCOME_TRY(canonical_hash, blockchain_->blockHashByNumber(header_opt->number));
    if (canonical_hash == block_hash) {
      return BlockKind::CANONICAL;
    }
    return BlockKind::FORK;
  }

  outcome::result<TrieLogCount> TrieLogMaintainer::count(size_t limit) const {
    OUTCOME_TRY(checkFormat());

    TrieLogCount count;
    if (limit == 0) {
      return count;
    }
    auto cursor = storage_->trieLogCursor();
    OUTCOME_TRY(cursor->seekFirst());
    while (cursor->isValid() and count.total < limit) {
      auto key = cursor->key();
      OUTCOME_TRY(kind, classify(*key));
      switch (kind) {
        case BlockKind::CANONICAL:
          ++count.canonical;
          break;
        case BlockKind::FORK:
          ++count.fork;
          break;
        case BlockKind::ORPHANED:
          ++count.orphaned;
          break;
      }
      ++count.total;
      OUTCOME_TRY(cursor->next());
    }
    SL_DEBUG(logger_,
             "Counted {} trie logs: {} canonical, {} fork, {} orphaned",
             count.total,
             count.canonical,
             count.fork,
             count.orphaned);
    return count;
  }

  outcome::result<std::unordered_set<primitives::BlockHash>>
  TrieLogMaintainer::canonicalHashes(primitives::BlockNumber from,
                                     primitives::BlockNumber to) const {
    std::unordered_set<primitives::BlockHash> hashes;
    hashes.reserve(to - from + 1);
    for (auto number = from; number <= to; ++number) {
      OUTCOME_TRY(hash_opt, blockchain_->blockHashByNumber(number));
      if (hash_opt) {
        hashes.emplace(*hash_opt);
      } else {
        SL_DEBUG(logger_, "No canonical block #{}", number);
      }
    }
    return hashes;
  }

  outcome::result<PruneStats> TrieLogMaintainer::prune(
      const filesystem::path &data_dir) {
    OUTCOME_TRY(checkFormat());

    OUTCOME_TRY(head, blockchain_->chainHead());
    const auto retention = config_.trie_log_retention;
    const primitives::BlockNumber window_start =
        head.number > retention ? head.number - retention : 0;

    OUTCOME_TRY(finalized, blockchain_->lastFinalized());
    if (finalized and window_start > finalized->number) {
      SL_ERROR(logger_,
               "Retention window #{}..#{} starts above last finalized block {}",
               window_start,
               head.number,
               *finalized);
      return TrieLogPruneError::RETENTION_WINDOW_ABOVE_FINALIZED;
    }

    OUTCOME_TRY(retained, canonicalHashes(window_start, head.number));
    SL_DEBUG(logger_,
             "Retaining trie logs of {} canonical blocks #{}..#{} (head {})",
             retained.size(),
             window_start,
             head.number,
             head);

    std::optional<common::Buffer> resume_after;
    OUTCOME_TRY(checkpoint, loadPruneCheckpoint(data_dir));
    if (checkpoint) {
      if (checkpoint->head == head.hash and checkpoint->retention == retention) {
        SL_INFO(logger_,
                "Resuming interrupted prune after key {}",
                checkpoint->last_key);
        resume_after = std::move(checkpoint->last_key);
      } else {
        SL_INFO(logger_, "Discarding prune checkpoint of another chain head");
      }
    }

    auto cursor = storage_->trieLogCursor();
    if (resume_after) {
      OUTCOME_TRY(cursor->seekLowerBound(*resume_after));
      if (cursor->isValid() and cursor->key() == resume_after) {
        OUTCOME_TRY(cursor->next());
      }
    } else {
      OUTCOME_TRY(cursor->seekFirst());
    }

    auto batch = storage_->trieLogBatch();
    PruneStats stats;
    while (cursor->isValid()) {
      auto key = *cursor->key();
      auto block_hash = primitives::BlockHash::fromSpan(key);
      if (block_hash.has_value() and retained.contains(block_hash.value())) {
        ++stats.retained;
      } else {
        SL_TRACE(logger_, "Removing trie log {}", key);
        OUTCOME_TRY(batch->remove(key));
        ++stats.pruned;
      }
      OUTCOME_TRY(cursor->next());

      if (batch->size() >= config_.trie_log_prune_batch_size) {
        OUTCOME_TRY(batch->commit());
        OUTCOME_TRY(savePruneCheckpoint(
            data_dir, PruneCheckpoint{head.hash, retention, std::move(key)}));
        SL_DEBUG(logger_, "Pruned {} trie logs so far", stats.pruned);
      }
    }
    if (batch->size() > 0) {
      OUTCOME_TRY(batch->commit());
    }
    OUTCOME_TRY(removePruneCheckpoint(data_dir));

    SL_DEBUG(logger_,
             "Prune finished: {} trie logs retained, {} pruned",
             stats.retained,
             stats.pruned);
    return stats;
  }

  outcome::result<size_t> TrieLogMaintainer::exportTrieLog(
      const std::vector<primitives::BlockHash> &block_hashes,
      const filesystem::path &path) const {
    OUTCOME_TRY(checkFormat());

    OUTCOME_TRY(writer, TrieLogFileWriter::create(path));
    for (const auto &block_hash : block_hashes) {
      OUTCOME_TRY(trie_log, storage_->getTrieLog(block_hash));
      if (not trie_log) {
        SL_DEBUG(logger_, "No trie log of block {}, skipped", block_hash);
        continue;
      }
      OUTCOME_TRY(writer.write(block_hash, *trie_log));
    }
    OUTCOME_TRY(writer.finish());

    SL_DEBUG(logger_,
             "Exported {} of {} requested trie logs to {}",
             writer.framesWritten(),
             block_hashes.size(),
             path);
    return writer.framesWritten();
  }

  outcome::result<size_t> TrieLogMaintainer::importTrieLog(
      const filesystem::path &path) {
    OUTCOME_TRY(checkFormat());

    OUTCOME_TRY(reader, TrieLogFileReader::open(path));
    size_t imported = 0;
    while (true) {
      auto frame_res = reader.next();
      if (frame_res.has_error()) {
        SL_ERROR(logger_,
                 "Import from {} stopped after {} trie logs: {}",
                 path,
                 imported,
                 frame_res.error().message());
        return frame_res.as_failure();
      }
      auto &frame = frame_res.value();
      if (not frame) {
        break;
      }
      OUTCOME_TRY(storage_->putTrieLog(frame->block_hash, frame->trie_log));
      ++imported;
    }

    SL_DEBUG(logger_, "Imported {} trie logs from {}", imported, path);
    return imported;
  }

}  // namespace trielog::storage::trie_log
