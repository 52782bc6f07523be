/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include "storage/database_error.hpp"
#include "testutil/literals.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

using trielog::common::Buffer;
using trielog::storage::BufferStorage;
using trielog::storage::DatabaseError;
using trielog::storage::RocksDb;
using trielog::storage::Space;

/// Node database in a temporary directory, default space at hand
struct RocksDb_Integration_Test : public test::BaseFS_Test {
  RocksDb_Integration_Test()
      : BaseFS_Test(uniqueTempPath("trielog_rocksdb_integration_test")) {}

  void SetUp() override {
    BaseFS_Test::SetUp();
    open();
  }

  void TearDown() override {
    db_.reset();
    rocks_.reset();
    BaseFS_Test::TearDown();
  }

  void open() {
    auto r = RocksDb::create(base_path / "database");
    ASSERT_TRUE(r) << "Can't open database: " << r.error().message();
    rocks_ = std::move(r.value());
    db_ = rocks_->getSpace(Space::kDefault);
  }

  std::shared_ptr<RocksDb> rocks_;
  std::shared_ptr<BufferStorage> db_;
  Buffer key_ = "key"_buf;
  Buffer value_ = "value"_buf;
};

/**
 * @given opened database
 * @when put {key}
 * @then {key} exists, its value is read back
 */
TEST_F(RocksDb_Integration_Test, Put_Get) {
  EXPECT_OUTCOME_TRUE_1(db_->put(key_, Buffer(value_)));
  EXPECT_OUTCOME_TRUE(contains, db_->contains(key_));
  EXPECT_TRUE(contains);
  EXPECT_OUTCOME_TRUE(val, db_->get(key_));
  EXPECT_EQ(val, value_);
}

/**
 * @given empty database
 * @when read {key}
 * @then get returns NOT_FOUND, tryGet returns nothing
 */
TEST_F(RocksDb_Integration_Test, Get_NonExistent) {
  EXPECT_TRUE(db_->empty());
  EXPECT_OUTCOME_TRUE_1(db_->remove(key_));
  EXPECT_EC(db_->get(key_), DatabaseError::NOT_FOUND);
  EXPECT_OUTCOME_TRUE(opt, db_->tryGet(key_));
  EXPECT_FALSE(opt.has_value());
}

/**
 * @given batch with puts and a remove
 * @when batch is committed
 * @then nothing is visible before commit, everything is visible after it
 */
TEST_F(RocksDb_Integration_Test, WriteBatch) {
  std::vector<Buffer> keys{{1}, {3}, {5}, {7}};
  Buffer to_be_removed{3};

  auto batch = db_->batch();
  for (const auto &key : keys) {
    EXPECT_OUTCOME_TRUE_1(batch->put(key, Buffer(value_)));
  }
  EXPECT_OUTCOME_TRUE_1(batch->remove(to_be_removed));
  EXPECT_EQ(batch->size(), 5);
  EXPECT_TRUE(db_->empty());

  EXPECT_OUTCOME_TRUE_1(batch->commit());
  EXPECT_EQ(batch->size(), 0);

  for (const auto &key : keys) {
    EXPECT_OUTCOME_TRUE(contains, db_->contains(key));
    EXPECT_EQ(contains, key != to_be_removed);
  }
}

/**
 * @given database with keys 1, 3, 5
 * @when cursor walks it from the first key and from a lower bound
 * @then keys are visited in order
 */
TEST_F(RocksDb_Integration_Test, Cursor) {
  for (uint8_t i : {5, 1, 3}) {
    EXPECT_OUTCOME_TRUE_1(db_->put(Buffer{i}, Buffer{i, i}));
  }

  auto cursor = db_->cursor();
  std::vector<Buffer> visited;
  EXPECT_OUTCOME_TRUE(valid, cursor->seekFirst());
  EXPECT_TRUE(valid);
  while (cursor->isValid()) {
    visited.emplace_back(*cursor->key());
    EXPECT_OUTCOME_TRUE_1(cursor->next());
  }
  EXPECT_EQ(visited, (std::vector<Buffer>{{1}, {3}, {5}}));

  EXPECT_OUTCOME_TRUE(found, cursor->seekLowerBound(Buffer{2}));
  EXPECT_TRUE(found);
  EXPECT_EQ(cursor->key(), Buffer{3});
  EXPECT_EQ(cursor->value()->view(), Buffer({3, 3}).view());

  EXPECT_OUTCOME_TRUE(not_found, cursor->seekLowerBound(Buffer{6}));
  EXPECT_FALSE(not_found);
  EXPECT_FALSE(cursor->key().has_value());
}

/**
 * @given values under the same key in different spaces
 * @when each space is read
 * @then every space returns its own value
 */
TEST_F(RocksDb_Integration_Test, SpacesAreIsolated) {
  auto trie_logs = rocks_->getSpace(Space::kTrieLog);
  auto headers = rocks_->getSpace(Space::kHeader);

  EXPECT_OUTCOME_TRUE_1(trie_logs->put(key_, "trie log"_buf));
  EXPECT_OUTCOME_TRUE_1(headers->put(key_, "header"_buf));

  EXPECT_OUTCOME_TRUE(trie_log, trie_logs->get(key_));
  EXPECT_EQ(trie_log, "trie log"_buf);
  EXPECT_OUTCOME_TRUE(header, headers->get(key_));
  EXPECT_EQ(header, "header"_buf);
  EXPECT_OUTCOME_TRUE(in_default, db_->contains(key_));
  EXPECT_FALSE(in_default);
}

/**
 * @given value written to the database
 * @when database is closed and opened again
 * @then value is still there
 */
TEST_F(RocksDb_Integration_Test, Reopen) {
  EXPECT_OUTCOME_TRUE_1(
      rocks_->getSpace(Space::kTrieLog)->put(key_, Buffer(value_)));
  db_.reset();
  rocks_.reset();

  open();
  EXPECT_OUTCOME_TRUE(val, rocks_->getSpace(Space::kTrieLog)->get(key_));
  EXPECT_EQ(val, value_);
}

/**
 * @given space whose database is closed
 * @when it is read
 * @then STORAGE_GONE is returned
 */
TEST_F(RocksDb_Integration_Test, StorageGone) {
  auto space = rocks_->getSpace(Space::kTrieLog);
  db_.reset();
  rocks_.reset();

  EXPECT_EC(space->get(key_), DatabaseError::STORAGE_GONE);
  EXPECT_EC(space->put(key_, Buffer(value_)), DatabaseError::STORAGE_GONE);
}
