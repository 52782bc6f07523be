/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/iterator.h>

#include "storage/rocksdb/rocksdb.hpp"

namespace trielog::storage {

  class RocksDBCursor : public BufferStorageCursor {
   public:
    ~RocksDBCursor() override = default;

    explicit RocksDBCursor(std::unique_ptr<rocksdb::Iterator> it);

    outcome::result<bool> seekFirst() override;

    outcome::result<bool> seekLowerBound(const BufferView &key) override;

    bool isValid() const override;

    outcome::result<void> next() override;

    std::optional<Buffer> key() const override;

    std::optional<BufferOrView> value() const override;

   private:
    outcome::result<bool> checkedValid() const;

    std::unique_ptr<rocksdb::Iterator> i_;
  };

}  // namespace trielog::storage
