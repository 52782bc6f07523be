/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rocksdb/db.h>
#include <boost/container/flat_map.hpp>

#include "common/buffer.hpp"
#include "filesystem/common.hpp"
#include "log/logger.hpp"
#include "storage/buffer_map_types.hpp"
#include "storage/spaced_storage.hpp"

namespace trielog::storage {

  /**
   * Node database. Every storage space is a column family of one RocksDB
   * instance.
   */
  class RocksDb : public SpacedStorage,
                  public std::enable_shared_from_this<RocksDb> {
   public:
    ~RocksDb() override;

    RocksDb(const RocksDb &) = delete;
    RocksDb(RocksDb &&) = delete;
    RocksDb &operator=(const RocksDb &) = delete;
    RocksDb &operator=(RocksDb &&) = delete;

    /**
     * Opens the database in `path`, creating the directory, the database and
     * missing column families when needed. Fails on column families of
     * unknown spaces.
     */
    static outcome::result<std::shared_ptr<RocksDb>> create(
        const filesystem::path &path,
        rocksdb::Options options = rocksdb::Options());

    std::shared_ptr<BufferStorage> getSpace(Space space) override;

    friend class RocksDbSpace;
    friend class RocksDbBatch;

   private:
    RocksDb();

    rocksdb::ColumnFamilyHandle *getCFHandle(Space space) const;

    rocksdb::DB *db_{};
    std::vector<rocksdb::ColumnFamilyHandle *> column_family_handles_;
    boost::container::flat_map<Space, std::shared_ptr<class RocksDbSpace>>
        spaces_;
    rocksdb::ReadOptions ro_;
    rocksdb::WriteOptions wo_;
    log::Logger logger_;
  };

  class RocksDbSpace : public BufferStorage {
   public:
    ~RocksDbSpace() override = default;

    RocksDbSpace(std::weak_ptr<RocksDb> storage,
                 Space space,
                 log::Logger logger);

    std::unique_ptr<BufferBatch> batch() override;

    std::unique_ptr<Cursor> cursor() override;

    outcome::result<bool> contains(const BufferView &key) const override;

    bool empty() const override;

    outcome::result<BufferOrView> get(const BufferView &key) const override;

    outcome::result<std::optional<BufferOrView>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key,
                              BufferOrView &&value) override;

    outcome::result<void> remove(const BufferView &key) override;

   private:
    // gather storage instance from weak ptr
    outcome::result<std::shared_ptr<RocksDb>> use() const;

    std::weak_ptr<RocksDb> storage_;
    Space space_;
    log::Logger logger_;
  };
}  // namespace trielog::storage
