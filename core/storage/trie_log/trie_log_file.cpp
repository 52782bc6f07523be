/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/trie_log/trie_log_file.hpp"

#include <limits>

#include <boost/endian/conversion.hpp>

#include "storage/trie_log/trie_log_error.hpp"

namespace trielog::storage::trie_log {

  TrieLogFileWriter::TrieLogFileWriter(TmpFile tmp, std::ofstream out)
      : tmp_{std::move(tmp)}, out_{std::move(out)} {}

  outcome::result<TrieLogFileWriter> TrieLogFileWriter::create(
      const filesystem::path &path) {
    TmpFile tmp{path};
    std::ofstream out{tmp.path(), std::ios::binary | std::ios::trunc};
    if (not out.is_open()) {
      return TrieLogIoError::CANNOT_OPEN_FILE;
    }
    TrieLogFileWriter writer{std::move(tmp), std::move(out)};

    common::Buffer header;
    header.put(common::BufferView(kTrieLogFileMagic));
    header.putUint8(kTrieLogFileVersion);
    header.putUint8(kTrieLogFileHashWidth);
    OUTCOME_TRY(writer.writeBytes(header));
    return writer;
  }

  outcome::result<void> TrieLogFileWriter::write(
      const primitives::BlockHash &block_hash, common::BufferView trie_log) {
    if (trie_log.size() > std::numeric_limits<uint32_t>::max()) {
      return TrieLogIoError::CANNOT_WRITE_FILE;
    }
    common::Buffer frame_header;
    frame_header.reserve(kTrieLogFrameHeaderSize);
    frame_header.put(block_hash);
    frame_header.putUint32(static_cast<uint32_t>(trie_log.size()));
    OUTCOME_TRY(writeBytes(frame_header));
    OUTCOME_TRY(writeBytes(trie_log));
    ++frames_;
    return outcome::success();
  }

  outcome::result<void> TrieLogFileWriter::finish() {
    out_.flush();
    if (not out_.good()) {
      return TrieLogIoError::CANNOT_WRITE_FILE;
    }
    out_.close();
    if (out_.fail()) {
      return TrieLogIoError::CANNOT_WRITE_FILE;
    }
    if (tmp_.rename().has_error()) {
      return TrieLogIoError::CANNOT_RENAME_FILE;
    }
    return outcome::success();
  }

  outcome::result<void> TrieLogFileWriter::writeBytes(
      common::BufferView bytes) {
    out_.write(reinterpret_cast<const char *>(bytes.data()),  // NOLINT
               static_cast<std::streamsize>(bytes.size()));
    if (not out_.good()) {
      return TrieLogIoError::CANNOT_WRITE_FILE;
    }
    return outcome::success();
  }

  TrieLogFileReader::TrieLogFileReader(std::ifstream in, uint64_t remaining)
      : in_{std::move(in)}, remaining_{remaining} {}

  outcome::result<TrieLogFileReader> TrieLogFileReader::open(
      const filesystem::path &path) {
    std::error_code ec;
    auto file_size = filesystem::file_size(path, ec);
    if (ec) {
      return TrieLogIoError::CANNOT_OPEN_FILE;
    }
    std::ifstream in{path, std::ios::binary};
    if (not in.is_open()) {
      return TrieLogIoError::CANNOT_OPEN_FILE;
    }
    TrieLogFileReader reader{std::move(in), file_size};

    if (reader.remaining_ < kTrieLogFileMagic.size()) {
      return TrieLogFormatError::TRUNCATED_HEADER;
    }
    std::array<uint8_t, kTrieLogFileMagic.size()> magic{};
    OUTCOME_TRY(reader.readBytes(magic.data(), magic.size()));
    if (magic != kTrieLogFileMagic) {
      return TrieLogFormatError::BAD_MAGIC;
    }

    if (reader.remaining_ < 2) {
      return TrieLogFormatError::TRUNCATED_HEADER;
    }
    uint8_t version = 0;
    uint8_t hash_width = 0;
    OUTCOME_TRY(reader.readBytes(&version, 1));
    OUTCOME_TRY(reader.readBytes(&hash_width, 1));
    if (version != kTrieLogFileVersion) {
      return TrieLogFormatError::UNSUPPORTED_VERSION;
    }
    if (hash_width != kTrieLogFileHashWidth) {
      return TrieLogFormatError::UNSUPPORTED_HASH_WIDTH;
    }
    return reader;
  }

  outcome::result<std::optional<TrieLogFrame>> TrieLogFileReader::next() {
    if (remaining_ == 0) {
      return std::nullopt;
    }
    if (remaining_ < kTrieLogFrameHeaderSize) {
      return TrieLogFormatError::TRUNCATED_FRAME;
    }

    TrieLogFrame frame;
    OUTCOME_TRY(readBytes(frame.block_hash.data(), frame.block_hash.size()));
    uint32_t length = 0;
    OUTCOME_TRY(readBytes(reinterpret_cast<uint8_t *>(&length),  // NOLINT
                          sizeof(length)));
    boost::endian::big_to_native_inplace(length);

    if (length > remaining_) {
      return TrieLogFormatError::LENGTH_MISMATCH;
    }
    frame.trie_log.resize(length);
    OUTCOME_TRY(readBytes(frame.trie_log.data(), length));
    return frame;
  }

  outcome::result<void> TrieLogFileReader::readBytes(uint8_t *out,
                                                     size_t size) {
    in_.read(reinterpret_cast<char *>(out),  // NOLINT
             static_cast<std::streamsize>(size));
    if (static_cast<size_t>(in_.gcount()) != size) {
      return TrieLogIoError::CANNOT_READ_FILE;
    }
    remaining_ -= size;
    return outcome::success();
  }

}  // namespace trielog::storage::trie_log
