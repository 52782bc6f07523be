/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include "outcome/outcome.hpp"
#include "storage/face/view.hpp"

namespace trielog::storage::face {

  /**
   * @brief An abstraction over generic map cursor.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct MapCursor {
    virtual ~MapCursor() = default;

    /**
     * @brief Same as std::begin(...);
     * @return error if any, true if map is not empty, false otherwise
     */
    virtual outcome::result<bool> seekFirst() = 0;

    /**
     * @brief Seek to the first key not less than the given one.
     *   map.put(2)
     *   seekLowerBound(1) -> 2
     *   seekLowerBound(2) -> 2
     *   seekLowerBound(3) -> none
     * @return error if any, true if cursor points to an element
     */
    virtual outcome::result<bool> seekLowerBound(const View<K> &key) = 0;

    /**
     * @brief Is the cursor in a valid state?
     * @return true if the cursor points to an element of the map, false
     * otherwise
     */
    virtual bool isValid() const = 0;

    /**
     * @brief Make step forward.
     */
    virtual outcome::result<void> next() = 0;

    /**
     * @brief Getter for the key of the element currently pointed at.
     * @return key if isValid()
     */
    virtual std::optional<K> key() const = 0;

    /**
     * @brief Getter for value of the element currently pointed at.
     * @return value if isValid()
     */
    virtual std::optional<OwnedOrView<V>> value() const = 0;
  };

}  // namespace trielog::storage::face
