/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb_cursor.hpp"

#include "storage/rocksdb/rocksdb_util.hpp"

namespace trielog::storage {

  RocksDBCursor::RocksDBCursor(std::unique_ptr<rocksdb::Iterator> it)
      : i_{std::move(it)} {}

  outcome::result<bool> RocksDBCursor::seekFirst() {
    i_->SeekToFirst();
    return checkedValid();
  }

  outcome::result<bool> RocksDBCursor::seekLowerBound(const BufferView &key) {
    i_->Seek(make_slice(key));
    return checkedValid();
  }

  bool RocksDBCursor::isValid() const {
    return i_->Valid();
  }

  outcome::result<void> RocksDBCursor::next() {
    i_->Next();
    OUTCOME_TRY(checkedValid());
    return outcome::success();
  }

  std::optional<Buffer> RocksDBCursor::key() const {
    return isValid() ? std::make_optional(make_buffer(i_->key()))
                     : std::nullopt;
  }

  std::optional<BufferOrView> RocksDBCursor::value() const {
    if (not isValid()) {
      return std::nullopt;
    }
    return std::make_optional<BufferOrView>(make_buffer(i_->value()));
  }

  // iterator turns invalid both at the end and on failure
  outcome::result<bool> RocksDBCursor::checkedValid() const {
    if (i_->Valid()) {
      return true;
    }
    return status_as_result(i_->status()).map([] { return false; });
  }
}  // namespace trielog::storage
