/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/spaced_storage.hpp"

namespace trielog::storage {

  /**
   * Spaced storage keeping every space in its own InMemoryStorage.
   * Spaces are created on first access.
   */
  class InMemorySpacedStorage : public SpacedStorage {
   public:
    ~InMemorySpacedStorage() override = default;

    std::shared_ptr<BufferStorage> getSpace(Space space) override {
      auto it = spaces_.find(space);
      if (it != spaces_.end()) {
        return it->second;
      }
      return spaces_.emplace(space, std::make_shared<InMemoryStorage>())
          .first->second;
    }

   private:
    std::map<Space, std::shared_ptr<InMemoryStorage>> spaces_;
  };

}  // namespace trielog::storage
