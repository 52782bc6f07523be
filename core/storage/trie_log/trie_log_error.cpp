/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/trie_log/trie_log_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(trielog::storage::trie_log,
                            TrieLogPreconditionError,
                            e) {
  using E = trielog::storage::trie_log::TrieLogPreconditionError;
  switch (e) {
    case E::UNSUPPORTED_STORAGE_FORMAT:
      return "trie logs are only kept with the BONSAI data storage format";
  }
  return "unknown TrieLogPreconditionError";
}

OUTCOME_CPP_DEFINE_CATEGORY(trielog::storage::trie_log, TrieLogIoError, e) {
  using E = trielog::storage::trie_log::TrieLogIoError;
  switch (e) {
    case E::CANNOT_OPEN_FILE:
      return "cannot open trie-log file";
    case E::CANNOT_WRITE_FILE:
      return "cannot write trie-log file";
    case E::CANNOT_READ_FILE:
      return "cannot read trie-log file";
    case E::CANNOT_RENAME_FILE:
      return "cannot move temporary file into place";
    case E::CANNOT_REMOVE_FILE:
      return "cannot remove file";
  }
  return "unknown TrieLogIoError";
}

OUTCOME_CPP_DEFINE_CATEGORY(trielog::storage::trie_log, TrieLogFormatError, e) {
  using E = trielog::storage::trie_log::TrieLogFormatError;
  switch (e) {
    case E::BAD_MAGIC:
      return "not a trie-log file: bad magic";
    case E::UNSUPPORTED_VERSION:
      return "unsupported trie-log file version";
    case E::UNSUPPORTED_HASH_WIDTH:
      return "unsupported block hash width in trie-log file";
    case E::TRUNCATED_HEADER:
      return "trie-log file header is truncated";
    case E::TRUNCATED_FRAME:
      return "trie-log file frame is truncated";
    case E::LENGTH_MISMATCH:
      return "trie-log payload length exceeds the file size";
  }
  return "unknown TrieLogFormatError";
}

OUTCOME_CPP_DEFINE_CATEGORY(trielog::storage::trie_log, TrieLogPruneError, e) {
  using E = trielog::storage::trie_log::TrieLogPruneError;
  switch (e) {
    case E::RETENTION_WINDOW_ABOVE_FINALIZED:
      return "retention window starts above the last finalized block";
    case E::CORRUPTED_CHECKPOINT:
      return "trie-log prune checkpoint is corrupted";
  }
  return "unknown TrieLogPruneError";
}
