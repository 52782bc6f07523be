/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <fstream>

#include "common/buffer.hpp"
#include "filesystem/common.hpp"
#include "primitives/common.hpp"
#include "utils/write_file.hpp"

/**
 * Trie-log file layout (all integers big-endian)
 *
 *   header : "TLOG" | version u8 | hash width u8
 *   frame  : block hash | payload length u32 | payload
 *
 * Frames follow the header up to the end of file.
 */

namespace trielog::storage::trie_log {

  constexpr std::array<uint8_t, 4> kTrieLogFileMagic{'T', 'L', 'O', 'G'};
  constexpr uint8_t kTrieLogFileVersion = 1;
  constexpr uint8_t kTrieLogFileHashWidth = primitives::BlockHash::size();
  constexpr size_t kTrieLogFileHeaderSize = kTrieLogFileMagic.size() + 2;
  constexpr size_t kTrieLogFrameHeaderSize =
      kTrieLogFileHashWidth + sizeof(uint32_t);

  struct TrieLogFrame {
    primitives::BlockHash block_hash;
    common::Buffer trie_log;
  };

  /**
   * Writes frames into `<path>.tmp` and moves it to `path` on finish().
   * The temporary file is removed when the writer is dropped unfinished.
   */
  class TrieLogFileWriter {
   public:
    TrieLogFileWriter(TrieLogFileWriter &&) = default;
    TrieLogFileWriter(const TrieLogFileWriter &) = delete;
    TrieLogFileWriter &operator=(const TrieLogFileWriter &) = delete;
    TrieLogFileWriter &operator=(TrieLogFileWriter &&) = delete;
    ~TrieLogFileWriter() = default;

    /// Creates the temporary file and writes the file header
    static outcome::result<TrieLogFileWriter> create(
        const filesystem::path &path);

    outcome::result<void> write(const primitives::BlockHash &block_hash,
                                common::BufferView trie_log);

    /// Flushes and closes the file, then renames it to the target path
    outcome::result<void> finish();

    size_t framesWritten() const {
      return frames_;
    }

   private:
    TrieLogFileWriter(TmpFile tmp, std::ofstream out);

    outcome::result<void> writeBytes(common::BufferView bytes);

    // declared before the stream: the file is closed before it is removed
    TmpFile tmp_;
    std::ofstream out_;
    size_t frames_ = 0;
  };

  /// Sequential reader of a trie-log file
  class TrieLogFileReader {
   public:
    TrieLogFileReader(TrieLogFileReader &&) = default;
    TrieLogFileReader(const TrieLogFileReader &) = delete;
    TrieLogFileReader &operator=(const TrieLogFileReader &) = delete;
    TrieLogFileReader &operator=(TrieLogFileReader &&) = delete;
    ~TrieLogFileReader() = default;

    /// Opens the file and validates its header
    static outcome::result<TrieLogFileReader> open(
        const filesystem::path &path);

    /**
     * @return next frame, or std::nullopt when the end of file is reached
     * exactly on a frame boundary
     */
    outcome::result<std::optional<TrieLogFrame>> next();

   private:
    TrieLogFileReader(std::ifstream in, uint64_t remaining);

    outcome::result<void> readBytes(uint8_t *out, size_t size);

    std::ifstream in_;
    uint64_t remaining_;
  };

}  // namespace trielog::storage::trie_log
