/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/rocksdb/rocksdb.hpp"

#include <rocksdb/cache.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/table.h>

#include "storage/database_error.hpp"
#include "storage/rocksdb/rocksdb_batch.hpp"
#include "storage/rocksdb/rocksdb_cursor.hpp"
#include "storage/rocksdb/rocksdb_spaces.hpp"
#include "storage/rocksdb/rocksdb_util.hpp"
#include "utils/mkdirs.hpp"

namespace trielog::storage {
  namespace fs = filesystem;

  namespace {
    constexpr uint64_t kBlockCacheSize = 64ull << 20;
    constexpr size_t kBlockSize = 32ull << 10;

    /// Same table options for every column family
    rocksdb::ColumnFamilyOptions columnOptions() {
      rocksdb::BlockBasedTableOptions table_options;
      table_options.format_version = 5;
      table_options.block_cache = rocksdb::NewLRUCache(kBlockCacheSize);
      table_options.block_size = kBlockSize;
      table_options.cache_index_and_filter_blocks = true;
      table_options.filter_policy.reset(
          rocksdb::NewBloomFilterPolicy(10, false));

      rocksdb::ColumnFamilyOptions options;
      options.table_factory.reset(
          rocksdb::NewBlockBasedTableFactory(table_options));
      return options;
    }
  }  // namespace

  RocksDb::RocksDb() : logger_(log::createLogger("RocksDB", "rocksdb")) {
    ro_.fill_cache = false;
  }

  RocksDb::~RocksDb() {
    for (auto *handle : column_family_handles_) {
      auto status = db_->DestroyColumnFamilyHandle(handle);
      if (not status.ok()) {
        SL_ERROR(logger_,
                 "Can't destroy column family handle: {}",
                 status.ToString());
      }
    }
    delete db_;
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDb::create(
      const filesystem::path &path, rocksdb::Options options) {
    auto log = log::createLogger("RocksDB", "rocksdb");

    OUTCOME_TRY(mkdirs(path));
    auto absolute_path = fs::absolute(path);
    if (not fs::is_directory(absolute_path)) {
      SL_ERROR(log,
               "Can't open {} for database: is not a directory",
               absolute_path);
      return DatabaseError::IO_ERROR;
    }

    std::vector<std::string> existing_families;
    auto res = rocksdb::DB::ListColumnFamilies(
        options, absolute_path.native(), &existing_families);
    if (not res.ok() and not res.IsPathNotFound() and not res.IsIOError()) {
      SL_ERROR(log,
               "Can't list column families in {}: {}",
               absolute_path,
               res.ToString());
      return status_as_error(res);
    }
    for (auto &family : existing_families) {
      if (not spaceByName(family)) {
        SL_ERROR(log, "Unknown column family {} in {}", family, absolute_path);
        return DatabaseError::UNEXPECTED_SPACE;
      }
    }

    std::vector<rocksdb::ColumnFamilyDescriptor> column_family_descriptors;
    for (auto i = 0; i < Space::kTotal; ++i) {
      column_family_descriptors.emplace_back(spaceName(static_cast<Space>(i)),
                                             columnOptions());
    }

    options.create_if_missing = true;
    options.create_missing_column_families = true;

    auto rocks_db = std::shared_ptr<RocksDb>(new RocksDb);
    auto status = rocksdb::DB::Open(options,
                                    absolute_path.native(),
                                    column_family_descriptors,
                                    &rocks_db->column_family_handles_,
                                    &rocks_db->db_);
    if (not status.ok()) {
      SL_ERROR(log,
               "Can't open database in {}: {}",
               absolute_path,
               status.ToString());
      return status_as_error(status);
    }

    for (auto *handle : rocks_db->column_family_handles_) {
      auto space = spaceByName(handle->GetName());
      if (not space) {
        return DatabaseError::UNEXPECTED_SPACE;
      }
      rocks_db->spaces_[*space] = std::make_shared<RocksDbSpace>(
          rocks_db->weak_from_this(), *space, rocks_db->logger_);
    }
    SL_DEBUG(log, "Database opened in {}", absolute_path);
    return rocks_db;
  }

  std::shared_ptr<BufferStorage> RocksDb::getSpace(Space space) {
    auto it = spaces_.find(space);
    BOOST_ASSERT(it != spaces_.end());
    return it->second;
  }

  rocksdb::ColumnFamilyHandle *RocksDb::getCFHandle(Space space) const {
    BOOST_ASSERT_MSG(static_cast<size_t>(space) < column_family_handles_.size(),
                     "All spaces should have an associated column family");
    auto handle = column_family_handles_[static_cast<size_t>(space)];
    BOOST_ASSERT(handle != nullptr);
    return handle;
  }

  RocksDbSpace::RocksDbSpace(std::weak_ptr<RocksDb> storage,
                             Space space,
                             log::Logger logger)
      : storage_{std::move(storage)},
        space_{space},
        logger_{std::move(logger)} {}

  std::unique_ptr<BufferBatch> RocksDbSpace::batch() {
    auto rocks = storage_.lock();
    if (not rocks) {
      throw std::system_error(make_error_code(DatabaseError::STORAGE_GONE));
    }
    return std::make_unique<RocksDbBatch>(rocks, rocks->getCFHandle(space_));
  }

  std::unique_ptr<RocksDbSpace::Cursor> RocksDbSpace::cursor() {
    auto rocks = storage_.lock();
    if (not rocks) {
      throw std::system_error(make_error_code(DatabaseError::STORAGE_GONE));
    }
    auto it = std::unique_ptr<rocksdb::Iterator>(
        rocks->db_->NewIterator(rocks->ro_, rocks->getCFHandle(space_)));
    return std::make_unique<RocksDBCursor>(std::move(it));
  }

  outcome::result<bool> RocksDbSpace::contains(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    return value.has_value();
  }

  bool RocksDbSpace::empty() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return true;
    }
    std::unique_ptr<rocksdb::Iterator> it(
        rocks->db_->NewIterator(rocks->ro_, rocks->getCFHandle(space_)));
    it->SeekToFirst();
    return not it->Valid();
  }

  outcome::result<BufferOrView> RocksDbSpace::get(const BufferView &key) const {
    OUTCOME_TRY(value, tryGet(key));
    if (not value) {
      return DatabaseError::NOT_FOUND;
    }
    return std::move(*value);
  }

  outcome::result<std::optional<BufferOrView>> RocksDbSpace::tryGet(
      const BufferView &key) const {
    OUTCOME_TRY(rocks, use());
    rocksdb::PinnableSlice value;
    auto status = rocks->db_->Get(
        rocks->ro_, rocks->getCFHandle(space_), make_slice(key), &value);
    if (status.ok()) {
      return std::make_optional<BufferOrView>(make_buffer(value));
    }

    if (status.IsNotFound()) {
      return std::nullopt;
    }

    return status_as_error(status);
  }

  outcome::result<void> RocksDbSpace::put(const BufferView &key,
                                          BufferOrView &&value) {
    OUTCOME_TRY(rocks, use());
    return status_as_result(rocks->db_->Put(rocks->wo_,
                                            rocks->getCFHandle(space_),
                                            make_slice(key),
                                            make_slice(value.view())));
  }

  outcome::result<void> RocksDbSpace::remove(const BufferView &key) {
    OUTCOME_TRY(rocks, use());
    return status_as_result(rocks->db_->Delete(
        rocks->wo_, rocks->getCFHandle(space_), make_slice(key)));
  }

  outcome::result<std::shared_ptr<RocksDb>> RocksDbSpace::use() const {
    auto rocks = storage_.lock();
    if (not rocks) {
      return DatabaseError::STORAGE_GONE;
    }
    return rocks;
  }

}  // namespace trielog::storage
