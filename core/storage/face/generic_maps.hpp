/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>

#include "outcome/outcome.hpp"
#include "storage/face/map_cursor.hpp"
#include "storage/face/view.hpp"
#include "storage/face/write_batch.hpp"

namespace trielog::storage::face {

  template <typename K, typename V>
  struct Readable {
    virtual ~Readable() = default;

    virtual outcome::result<bool> contains(const View<K> &key) const = 0;

    virtual bool empty() const = 0;

    /// @return value or DatabaseError::NOT_FOUND
    virtual outcome::result<OwnedOrView<V>> get(const View<K> &key) const = 0;

    /// @return value, or std::nullopt for an absent key
    virtual outcome::result<std::optional<OwnedOrView<V>>> tryGet(
        const View<K> &key) const = 0;
  };

  template <typename K, typename V>
  struct Iterable {
    using Cursor = MapCursor<K, V>;

    virtual ~Iterable() = default;

    /// New cursor, not positioned until one of its seek methods is called
    virtual std::unique_ptr<Cursor> cursor() = 0;
  };

  template <typename K, typename V>
  struct BatchWriteable {
    virtual ~BatchWriteable() = default;

    /// Batch of puts and removals applied together by commit()
    virtual std::unique_ptr<WriteBatch<K, V>> batch() = 0;
  };

  /**
   * Key-value map of one storage space. Trie logs, block headers and lookup
   * keys are kept in such maps, each in its own space.
   */
  template <typename K, typename V>
  struct GenericStorage : Readable<K, V>,
                          Iterable<K, V>,
                          Writeable<K, V>,
                          BatchWriteable<K, V> {};

}  // namespace trielog::storage::face
