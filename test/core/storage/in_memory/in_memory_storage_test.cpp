/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include <gtest/gtest.h>

#include "storage/database_error.hpp"
#include "storage/in_memory/in_memory_spaced_storage.hpp"
#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using trielog::common::Buffer;
using trielog::storage::DatabaseError;
using trielog::storage::InMemorySpacedStorage;
using trielog::storage::InMemoryStorage;
using trielog::storage::Space;

/**
 * @given in-memory storage
 * @when put, read and remove a value
 * @then every operation behaves like a persistent storage does
 */
TEST(InMemoryStorage, PutGetRemove) {
  InMemoryStorage storage;
  auto key = "key"_buf;

  EXPECT_TRUE(storage.empty());
  EXPECT_EC(storage.get(key), DatabaseError::NOT_FOUND);

  EXPECT_OUTCOME_TRUE_1(storage.put(key, "value"_buf));
  EXPECT_OUTCOME_TRUE(value, storage.get(key));
  EXPECT_EQ(value, "value"_buf);
  EXPECT_EQ(storage.size(), 1);

  EXPECT_OUTCOME_TRUE_1(storage.remove(key));
  EXPECT_OUTCOME_TRUE(contains, storage.contains(key));
  EXPECT_FALSE(contains);
  EXPECT_OUTCOME_TRUE_1(storage.remove(key));
}

/**
 * @given cursor positioned at a key
 * @when that key is removed and the cursor steps forward
 * @then cursor continues with the next remaining key
 */
TEST(InMemoryStorage, CursorSurvivesRemoval) {
  InMemoryStorage storage;
  for (uint8_t i : {1, 2, 3}) {
    EXPECT_OUTCOME_TRUE_1(storage.put(Buffer{i}, Buffer{i}));
  }

  auto cursor = storage.cursor();
  EXPECT_OUTCOME_TRUE_1(cursor->seekFirst());
  EXPECT_OUTCOME_TRUE_1(storage.remove(Buffer{1}));
  EXPECT_OUTCOME_TRUE_1(storage.remove(Buffer{2}));
  EXPECT_OUTCOME_TRUE_1(cursor->next());

  ASSERT_TRUE(cursor->isValid());
  EXPECT_EQ(cursor->key(), Buffer{3});
  EXPECT_OUTCOME_TRUE_1(cursor->next());
  EXPECT_FALSE(cursor->isValid());
}

/**
 * @given batch with puts and removes
 * @when batch is cleared or committed
 * @then only committed operations reach the storage, in order
 */
TEST(InMemoryStorage, Batch) {
  InMemoryStorage storage;
  auto batch = storage.batch();

  EXPECT_OUTCOME_TRUE_1(batch->put(Buffer{1}, "one"_buf));
  batch->clear();
  EXPECT_EQ(batch->size(), 0);

  EXPECT_OUTCOME_TRUE_1(batch->put(Buffer{2}, "two"_buf));
  EXPECT_OUTCOME_TRUE_1(batch->remove(Buffer{2}));
  EXPECT_OUTCOME_TRUE_1(batch->put(Buffer{3}, "three"_buf));
  EXPECT_TRUE(storage.empty());

  EXPECT_OUTCOME_TRUE_1(batch->commit());
  EXPECT_EQ(storage.size(), 1);
  EXPECT_OUTCOME_TRUE(value, storage.get(Buffer{3}));
  EXPECT_EQ(value, "three"_buf);
}

TEST(InMemorySpacedStorage, SameSpaceIsReturned) {
  InMemorySpacedStorage storage;
  auto trie_logs = storage.getSpace(Space::kTrieLog);

  EXPECT_EQ(trie_logs, storage.getSpace(Space::kTrieLog));
  EXPECT_NE(trie_logs, storage.getSpace(Space::kHeader));
}
