/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/trie_log/trie_log_file.hpp"

#include <gtest/gtest.h>

#include "storage/trie_log/trie_log_error.hpp"
#include "testutil/blockchain/chain_builder.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"
#include "utils/read_file.hpp"
#include "utils/write_file.hpp"

using testutil::blockHash;
using trielog::common::Buffer;
using trielog::storage::trie_log::TrieLogFileReader;
using trielog::storage::trie_log::TrieLogFileWriter;
using trielog::storage::trie_log::TrieLogFormatError;
using trielog::storage::trie_log::TrieLogIoError;

class TrieLogFileTest : public test::BaseFS_Test {
 public:
  TrieLogFileTest() : BaseFS_Test(uniqueTempPath("trielog_file_test")) {}

  void writeRaw(const Buffer &content) {
    trielog::writeFile(file_, content).value();
  }

  Buffer readRaw() {
    Buffer content;
    trielog::readFile(content, file_).value();
    return content;
  }

  fs::path file_ = base_path / "trie-logs.bin";
};

/**
 * @given two trie logs, one of them empty
 * @when they are written and the file is read back
 * @then frames come in the written order, the end of file is reported after
 * them
 */
TEST_F(TrieLogFileTest, WriteAndRead) {
  EXPECT_OUTCOME_TRUE(writer, TrieLogFileWriter::create(file_));
  EXPECT_OUTCOME_TRUE_1(writer.write(blockHash(1), "accounts"_buf));
  EXPECT_OUTCOME_TRUE_1(writer.write(blockHash(2), Buffer{}));
  EXPECT_OUTCOME_TRUE_1(writer.finish());
  EXPECT_EQ(writer.framesWritten(), 2);

  ASSERT_TRUE(fs::exists(file_));
  EXPECT_FALSE(fs::exists(file_.native() + ".tmp"));

  EXPECT_OUTCOME_TRUE(reader, TrieLogFileReader::open(file_));

  EXPECT_OUTCOME_TRUE(first, reader.next());
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->block_hash, blockHash(1));
  EXPECT_EQ(first->trie_log, "accounts"_buf);

  EXPECT_OUTCOME_TRUE(second, reader.next());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->block_hash, blockHash(2));
  EXPECT_TRUE(second->trie_log.empty());

  EXPECT_OUTCOME_TRUE(end, reader.next());
  EXPECT_FALSE(end.has_value());
}

/**
 * @given file with one frame
 * @when its bytes are inspected
 * @then header is magic, version and hash width, frame is hash followed by a
 * big-endian length and the payload
 */
TEST_F(TrieLogFileTest, Layout) {
  auto hash = blockHash(0x0102);
  EXPECT_OUTCOME_TRUE(writer, TrieLogFileWriter::create(file_));
  EXPECT_OUTCOME_TRUE_1(writer.write(hash, Buffer{0xaa, 0xbb}));
  EXPECT_OUTCOME_TRUE_1(writer.finish());

  Buffer expected = "TLOG"_buf;
  expected.putUint8(1).putUint8(32);
  expected.put(hash);
  expected.putUint32(2);
  expected.putUint8(0xaa).putUint8(0xbb);

  EXPECT_EQ(readRaw(), expected);
}

/**
 * @given writer which is destroyed before finish()
 * @when the destination directory is inspected
 * @then neither the target nor the temporary file exist
 */
TEST_F(TrieLogFileTest, UnfinishedWriteLeavesNoFile) {
  {
    EXPECT_OUTCOME_TRUE(writer, TrieLogFileWriter::create(file_));
    EXPECT_OUTCOME_TRUE_1(writer.write(blockHash(1), "state"_buf));
  }
  EXPECT_FALSE(fs::exists(file_));
  EXPECT_FALSE(fs::exists(file_.native() + ".tmp"));
}

/**
 * @given existing file and a writer over the same path which is not finished
 * @when writer is destroyed
 * @then previous content is untouched
 */
TEST_F(TrieLogFileTest, UnfinishedWriteKeepsPreviousFile) {
  writeRaw("previous"_buf);
  {
    EXPECT_OUTCOME_TRUE(writer, TrieLogFileWriter::create(file_));
    EXPECT_OUTCOME_TRUE_1(writer.write(blockHash(1), "state"_buf));
  }
  EXPECT_EQ(readRaw(), "previous"_buf);
}

TEST_F(TrieLogFileTest, CreateInMissingDirectory) {
  EXPECT_EC(TrieLogFileWriter::create(base_path / "absent" / "file.bin"),
            TrieLogIoError::CANNOT_OPEN_FILE);
}

TEST_F(TrieLogFileTest, OpenMissingFile) {
  EXPECT_EC(TrieLogFileReader::open(file_), TrieLogIoError::CANNOT_OPEN_FILE);
}

/**
 * @given files with damaged headers
 * @when they are opened
 * @then the matching format error is returned
 */
TEST_F(TrieLogFileTest, DamagedHeader) {
  writeRaw("TLO"_buf);
  EXPECT_EC(TrieLogFileReader::open(file_),
            TrieLogFormatError::TRUNCATED_HEADER);

  writeRaw("TLOG"_buf);
  EXPECT_EC(TrieLogFileReader::open(file_),
            TrieLogFormatError::TRUNCATED_HEADER);

  writeRaw("GOLT\x01\x20"_buf);
  EXPECT_EC(TrieLogFileReader::open(file_), TrieLogFormatError::BAD_MAGIC);

  writeRaw("TLOG\x02\x20"_buf);
  EXPECT_EC(TrieLogFileReader::open(file_),
            TrieLogFormatError::UNSUPPORTED_VERSION);

  writeRaw("TLOG\x01\x40"_buf);
  EXPECT_EC(TrieLogFileReader::open(file_),
            TrieLogFormatError::UNSUPPORTED_HASH_WIDTH);
}

/**
 * @given file with a valid header and an incomplete frame header
 * @when the frame is read
 * @then TRUNCATED_FRAME is returned
 */
TEST_F(TrieLogFileTest, TruncatedFrameHeader) {
  Buffer content = "TLOG\x01\x20"_buf;
  content.put(blockHash(1));
  writeRaw(content);

  EXPECT_OUTCOME_TRUE(reader, TrieLogFileReader::open(file_));
  EXPECT_EC(reader.next(), TrieLogFormatError::TRUNCATED_FRAME);
}

/**
 * @given frame declaring more payload bytes than the file has left
 * @when the frame is read
 * @then LENGTH_MISMATCH is returned
 */
TEST_F(TrieLogFileTest, PayloadShorterThanLength) {
  Buffer content = "TLOG\x01\x20"_buf;
  content.put(blockHash(1));
  content.putUint32(10);
  content.put("short"_buf);
  writeRaw(content);

  EXPECT_OUTCOME_TRUE(reader, TrieLogFileReader::open(file_));
  EXPECT_EC(reader.next(), TrieLogFormatError::LENGTH_MISMATCH);
}
