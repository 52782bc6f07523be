/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/db.h>
#include <rocksdb/write_batch.h>

#include "common/buffer.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/rocksdb/rocksdb.hpp"

namespace trielog::storage {

  /// Write batch bound to a single column family
  class RocksDbBatch : public BufferBatch {
   public:
    ~RocksDbBatch() override = default;

    RocksDbBatch(std::shared_ptr<RocksDb> db,
                 rocksdb::ColumnFamilyHandle *column_family);

    outcome::result<void> commit() override;

    size_t size() const override;

    void clear() override;

    outcome::result<void> put(const BufferView &key,
                              BufferOrView &&value) override;

    outcome::result<void> remove(const BufferView &key) override;

   private:
    std::shared_ptr<RocksDb> db_;
    rocksdb::WriteBatch batch_;
    rocksdb::ColumnFamilyHandle *column_family_;
  };
}  // namespace trielog::storage
