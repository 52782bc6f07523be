/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_batch.hpp"

#include "storage/database_error.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"

namespace trielog::storage {

  RocksDbBatch::RocksDbBatch(std::shared_ptr<RocksDb> db,
                             rocksdb::ColumnFamilyHandle *column_family)
      : db_(std::move(db)), column_family_(column_family) {
    BOOST_ASSERT(db_ != nullptr);
    BOOST_ASSERT(column_family_ != nullptr);
  }

  outcome::result<void> RocksDbBatch::put(const BufferView &key,
                                          BufferOrView &&value) {
    return status_as_result(
        batch_.Put(column_family_, make_slice(key), make_slice(value.view())));
  }

  outcome::result<void> RocksDbBatch::remove(const BufferView &key) {
    return status_as_result(batch_.Delete(column_family_, make_slice(key)));
  }

  outcome::result<void> RocksDbBatch::commit() {
    OUTCOME_TRY(status_as_result(db_->db_->Write(db_->wo_, &batch_)));
    batch_.Clear();
    return outcome::success();
  }

  size_t RocksDbBatch::size() const {
    return static_cast<size_t>(batch_.Count());
  }

  void RocksDbBatch::clear() {
    batch_.Clear();
  }
}  // namespace trielog::storage
