/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/storage_subcommand.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <fmt/format.h>

#include "storage/predefined_keys.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/world_state/world_state_storage.hpp"
#include "testutil/blockchain/chain_builder.hpp"
#include "testutil/literals.hpp"
#include "testutil/storage/base_fs_test.hpp"

using testing::HasSubstr;
using testutil::blockHash;
using trielog::storage::DataStorageFormat;
using trielog::storage::RocksDb;
using trielog::storage::WorldStateStorage;

class StorageSubcommandTest : public test::BaseFS_Test {
 public:
  StorageSubcommandTest()
      : BaseFS_Test(uniqueTempPath("trielog_storage_subcommand_test")) {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    base_path_str_ = base_path.native();

    // canonical chain #0..#5 with trie logs H1..H5 and a fork trie log at #4
    auto db = RocksDb::create(base_path / "database").value();
    db->getSpace(trielog::storage::Space::kDefault)
        ->put(trielog::storage::kDataStorageFormatKey, "BONSAI"_buf)
        .value();
    testutil::ChainBuilder chain{db};
    chain.canonical(5);
    chain.finalize({5, blockHash(5)});
    auto fork = chain.fork(4);
    WorldStateStorage world_state{db, DataStorageFormat::BONSAI};
    for (trielog::primitives::BlockNumber number = 1; number <= 5; ++number) {
      world_state.putTrieLog(blockHash(number), "trie log"_buf).value();
    }
    world_state.putTrieLog(fork.hash, "fork trie log"_buf).value();
  }

  /// Runs `storage trie-logs <args> -- --base-path <base> <node_args>`
  int run(std::vector<const char *> args,
          std::vector<const char *> node_args = {}) {
    std::vector<const char *> argv{"storage", "trie-logs"};
    argv.insert(argv.end(), args.begin(), args.end());
    argv.insert(argv.end(), {"--", "--base-path", base_path_str_.c_str()});
    argv.insert(argv.end(), node_args.begin(), node_args.end());
    return trielog::storage_subcommand_main(static_cast<int>(argv.size()),
                                            argv.data());
  }

  bool hasTrieLog(const trielog::primitives::BlockHash &block_hash) {
    auto db = RocksDb::create(base_path / "database").value();
    WorldStateStorage world_state{db, DataStorageFormat::BONSAI};
    return world_state.getTrieLog(block_hash).value().has_value();
  }

  std::string base_path_str_;
};

/**
 * @given node database with five canonical and one fork trie log
 * @when `count` is run
 * @then the breakdown is printed
 */
TEST_F(StorageSubcommandTest, Count) {
  testing::internal::CaptureStdout();
  auto code = run({"count"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, EXIT_SUCCESS);
  EXPECT_THAT(output, HasSubstr("Counting trie logs..."));
  EXPECT_THAT(output,
              HasSubstr("trieLog count: 6\n"
                        " - canonical count: 5\n"
                        " - fork count: 1\n"
                        " - orphaned count: 0\n"));
}

/**
 * @given node database with trie logs H1..H5 and a fork trie log
 * @when `prune` is run with a retention of 2 blocks
 * @then trie logs of #3..#5 are kept
 */
TEST_F(StorageSubcommandTest, Prune) {
  testing::internal::CaptureStdout();
  auto code = run({"prune"}, {"--bonsai-historical-block-limit", "2"});
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, EXIT_SUCCESS);
  EXPECT_THAT(output, HasSubstr("Pruned 3 trie logs, retained 3"));
  EXPECT_FALSE(hasTrieLog(blockHash(2)));
  EXPECT_FALSE(hasTrieLog(blockHash(4, 1)));
  EXPECT_TRUE(hasTrieLog(blockHash(3)));
}

/**
 * @given node database with trie logs
 * @when two of them are exported to the default file, removed by prune and
 * imported back
 * @then they are present again
 */
TEST_F(StorageSubcommandTest, ExportPruneImport) {
  auto hashes = fmt::format("{:l}, {:l}", blockHash(1), blockHash(2));

  EXPECT_EQ(run({"export", "--trie-log-block-hash", hashes.c_str()}),
            EXIT_SUCCESS);
  EXPECT_TRUE(fs::exists(base_path / "trie-logs.bin"));

  EXPECT_EQ(run({"prune"}, {"--bonsai-historical-block-limit", "2"}),
            EXIT_SUCCESS);
  EXPECT_FALSE(hasTrieLog(blockHash(1)));

  EXPECT_EQ(run({"import"}), EXIT_SUCCESS);
  EXPECT_TRUE(hasTrieLog(blockHash(1)));
  EXPECT_TRUE(hasTrieLog(blockHash(2)));
}

/**
 * @given export to an explicit path
 * @when export is run
 * @then file is written there
 */
TEST_F(StorageSubcommandTest, ExportToPath) {
  auto file = (base_path / "custom.bin").native();
  auto hash = fmt::format("{:l}", blockHash(3));

  EXPECT_EQ(run({"export",
                 "--trie-log-block-hash",
                 hash.c_str(),
                 "--trie-log-file-path",
                 file.c_str()}),
            EXIT_SUCCESS);
  EXPECT_TRUE(fs::exists(file));
}

/**
 * @given malformed command lines
 * @when they are run
 * @then failure is reported
 */
TEST_F(StorageSubcommandTest, BadArguments) {
  EXPECT_EQ(run({}), EXIT_FAILURE);
  EXPECT_EQ(run({"unknown"}), EXIT_FAILURE);
  EXPECT_EQ(run({"count", "extra"}), EXIT_FAILURE);
  EXPECT_EQ(run({"export"}), EXIT_FAILURE);
  EXPECT_EQ(run({"export", "--trie-log-block-hash", "0x01"}), EXIT_FAILURE);
  EXPECT_EQ(run({"import", "--trie-log-file-path", "absent.bin"}),
            EXIT_FAILURE);
  EXPECT_EQ(run({"count"}, {"--log", "unknown_group=debug"}), EXIT_FAILURE);
  EXPECT_EQ(run({"count"}, {"--log", "trie_log=loud"}), EXIT_FAILURE);
  EXPECT_EQ(run({"help"}), EXIT_SUCCESS);
}

/**
 * @given node database created with BONSAI format
 * @when a subcommand is run with FOREST configured
 * @then the format is refused, nothing is removed and the database stays
 * usable with BONSAI
 */
TEST_F(StorageSubcommandTest, ForestDatabase) {
  testing::internal::CaptureStderr();
  auto code = run({"prune"},
                  {"--data-storage-format",
                   "FOREST",
                   "--bonsai-historical-block-limit",
                   "2"});
  auto errors = testing::internal::GetCapturedStderr();

  EXPECT_EQ(code, EXIT_FAILURE);
  EXPECT_THAT(errors,
              HasSubstr("Subcommand only works with data-storage-format=BONSAI"));
  EXPECT_TRUE(hasTrieLog(blockHash(1)));
  EXPECT_EQ(run({"count"}), EXIT_SUCCESS);
}

/**
 * @given base path without a node database
 * @when a subcommand is run with FOREST configured, then with BONSAI
 * @then FOREST is refused before a database is created, so the BONSAI run
 * succeeds on the same base path
 */
TEST_F(StorageSubcommandTest, ForestIsRefusedBeforeOpening) {
  auto fresh_base = base_path / "fresh";
  auto fresh_base_str = fresh_base.native();
  const char *forest_argv[] = {"storage",
                               "trie-logs",
                               "count",
                               "--",
                               "--base-path",
                               fresh_base_str.c_str(),
                               "--data-storage-format",
                               "FOREST"};

  testing::internal::CaptureStderr();
  auto code = trielog::storage_subcommand_main(std::size(forest_argv),
                                               forest_argv);
  auto errors = testing::internal::GetCapturedStderr();

  EXPECT_EQ(code, EXIT_FAILURE);
  EXPECT_THAT(errors,
              HasSubstr("Subcommand only works with data-storage-format=BONSAI"));
  EXPECT_FALSE(fs::exists(fresh_base / "database"));

  const char *bonsai_argv[] = {"storage",
                               "trie-logs",
                               "count",
                               "--",
                               "--base-path",
                               fresh_base_str.c_str(),
                               "--data-storage-format",
                               "BONSAI"};
  testing::internal::CaptureStdout();
  code = trielog::storage_subcommand_main(std::size(bonsai_argv), bonsai_argv);
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, EXIT_SUCCESS);
  EXPECT_THAT(output, HasSubstr("trieLog count: 0\n"));
}

/**
 * @given node options with `--help`
 * @when a subcommand is run
 * @then node options are printed and the run succeeds without touching the
 * database
 */
TEST_F(StorageSubcommandTest, NodeHelp) {
  testing::internal::CaptureStdout();
  testing::internal::CaptureStderr();
  auto code = run({"prune"}, {"--help"});
  auto errors = testing::internal::GetCapturedStderr();
  auto output = testing::internal::GetCapturedStdout();

  EXPECT_EQ(code, EXIT_SUCCESS);
  EXPECT_THAT(output, HasSubstr("--base-path"));
  EXPECT_THAT(errors, testing::Not(HasSubstr("Failed to initialize")));
  EXPECT_TRUE(hasTrieLog(blockHash(1)));
}
