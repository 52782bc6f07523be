/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"
#include "storage/buffer_map_types.hpp"

namespace trielog::storage {

  /**
   * Simple ordered storage that conforms BufferStorage interface.
   * Mostly needed in tests to avoid integration with an actual persistent
   * database
   */
  class InMemoryStorage : public BufferStorage {
   public:
    ~InMemoryStorage() override = default;

    outcome::result<BufferOrView> get(const BufferView &key) const override;

    outcome::result<std::optional<BufferOrView>> tryGet(
        const BufferView &key) const override;

    outcome::result<void> put(const BufferView &key,
                              BufferOrView &&value) override;

    outcome::result<bool> contains(const BufferView &key) const override;

    bool empty() const override;

    size_t size() const;

    outcome::result<void> remove(const BufferView &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    std::unique_ptr<Cursor> cursor() override;

   private:
    struct Less {
      using is_transparent = void;

      bool operator()(const BufferView &lhs, const BufferView &rhs) const {
        return lhs < rhs;
      }
    };

    std::map<Buffer, Buffer, Less> storage_;

    friend class InMemoryCursor;
  };

}  // namespace trielog::storage
