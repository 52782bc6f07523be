/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace trielog::storage::trie_log {

  /// Storage is not in a state trie-log maintenance can work with
  enum class TrieLogPreconditionError {
    UNSUPPORTED_STORAGE_FORMAT = 1,
  };

  /// Trie-log file can not be accessed
  enum class TrieLogIoError {
    CANNOT_OPEN_FILE = 1,
    CANNOT_WRITE_FILE,
    CANNOT_READ_FILE,
    CANNOT_RENAME_FILE,
    CANNOT_REMOVE_FILE,
  };

  /// Trie-log file content is malformed
  enum class TrieLogFormatError {
    BAD_MAGIC = 1,
    UNSUPPORTED_VERSION,
    UNSUPPORTED_HASH_WIDTH,
    TRUNCATED_HEADER,
    TRUNCATED_FRAME,
    LENGTH_MISMATCH,
  };

  enum class TrieLogPruneError {
    RETENTION_WINDOW_ABOVE_FINALIZED = 1,
    CORRUPTED_CHECKPOINT,
  };

}  // namespace trielog::storage::trie_log

OUTCOME_HPP_DECLARE_ERROR(trielog::storage::trie_log, TrieLogPreconditionError)
OUTCOME_HPP_DECLARE_ERROR(trielog::storage::trie_log, TrieLogIoError)
OUTCOME_HPP_DECLARE_ERROR(trielog::storage::trie_log, TrieLogFormatError)
OUTCOME_HPP_DECLARE_ERROR(trielog::storage::trie_log, TrieLogPruneError)
