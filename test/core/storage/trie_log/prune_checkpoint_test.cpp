/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/trie_log/prune_checkpoint.hpp"

#include <gtest/gtest.h>

#include "storage/trie_log/trie_log_error.hpp"
#include "testutil/blockchain/chain_builder.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"
#include "utils/write_file.hpp"

using testutil::blockHash;
using trielog::common::Buffer;
using namespace trielog::storage::trie_log;

class PruneCheckpointTest : public test::BaseFS_Test {
 public:
  PruneCheckpointTest()
      : BaseFS_Test(uniqueTempPath("trielog_prune_checkpoint_test")) {}
};

/**
 * @given data directory without checkpoint
 * @when checkpoint is loaded
 * @then nothing is returned
 */
TEST_F(PruneCheckpointTest, Absent) {
  EXPECT_OUTCOME_TRUE(checkpoint, loadPruneCheckpoint(base_path));
  EXPECT_FALSE(checkpoint.has_value());

  EXPECT_OUTCOME_TRUE_1(removePruneCheckpoint(base_path));
}

/**
 * @given checkpoint of an interrupted prune
 * @when it is saved, loaded and removed
 * @then loaded checkpoint equals the saved one, nothing is loaded after removal
 */
TEST_F(PruneCheckpointTest, SaveLoadRemove) {
  PruneCheckpoint saved{blockHash(100), 512, Buffer(blockHash(7, 1))};

  EXPECT_OUTCOME_TRUE_1(savePruneCheckpoint(base_path, saved));
  EXPECT_TRUE(fs::exists(pruneCheckpointPath(base_path)));

  EXPECT_OUTCOME_TRUE(loaded, loadPruneCheckpoint(base_path));
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(*loaded, saved);

  saved.last_key = Buffer(blockHash(9, 1));
  EXPECT_OUTCOME_TRUE_1(savePruneCheckpoint(base_path, saved));
  EXPECT_OUTCOME_TRUE(replaced, loadPruneCheckpoint(base_path));
  ASSERT_TRUE(replaced.has_value());
  EXPECT_EQ(replaced->last_key, Buffer(blockHash(9, 1)));

  EXPECT_OUTCOME_TRUE_1(removePruneCheckpoint(base_path));
  EXPECT_OUTCOME_TRUE(removed, loadPruneCheckpoint(base_path));
  EXPECT_FALSE(removed.has_value());
}

/**
 * @given checkpoint file shorter than its fixed part
 * @when it is loaded
 * @then CORRUPTED_CHECKPOINT is returned
 */
TEST_F(PruneCheckpointTest, Corrupted) {
  trielog::writeFile(pruneCheckpointPath(base_path), "broken"_buf).value();

  EXPECT_EC(loadPruneCheckpoint(base_path),
            TrieLogPruneError::CORRUPTED_CHECKPOINT);
}

TEST_F(PruneCheckpointTest, Encoding) {
  PruneCheckpoint checkpoint{blockHash(1), 2, Buffer{0xab}};

  Buffer expected(blockHash(1));
  expected.putUint64(2);
  expected.putUint8(0xab);

  EXPECT_EQ(checkpoint.encode(), expected);
}
