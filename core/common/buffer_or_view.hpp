/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>
#include <type_traits>

#include <boost/variant/get.hpp>
#include <boost/variant/variant.hpp>

#include "common/buffer.hpp"

namespace trielog::common {
  /// Owned buffer or readonly view, returned by storage reads.
  class BufferOrView {
    struct Moved {};

   public:
    BufferOrView() = default;

    BufferOrView(const BufferView &view) : variant_{view} {}

    BufferOrView(Buffer &&buffer) : variant_{std::move(buffer)} {}

    BufferOrView(const BufferOrView &) = delete;
    BufferOrView(BufferOrView &&) = default;

    BufferOrView &operator=(const BufferOrView &) = delete;
    BufferOrView &operator=(BufferOrView &&) = default;

    /// Is buffer owned.
    bool isOwned() const {
      if (variant_.which() == 2) {
        throw std::logic_error{"Tried to use moved BufferOrView"};
      }
      return variant_.which() == 1;
    }

    BufferView view() const {
      if (not isOwned()) {
        return boost::get<BufferView>(variant_);
      }
      return BufferView{boost::get<Buffer>(variant_)};
    }

    operator BufferView() const {
      return view();
    }

    auto data() const {
      return view().data();
    }

    size_t size() const {
      return view().size();
    }

    auto begin() const {
      return view().begin();
    }

    auto end() const {
      return view().end();
    }

    /// Move buffer away. Copies once if it is a view.
    Buffer intoBuffer() {
      if (not isOwned()) {
        Buffer copy{boost::get<BufferView>(variant_)};
        variant_ = Moved{};
        return copy;
      }
      auto buffer = std::move(boost::get<Buffer>(variant_));
      variant_ = Moved{};
      return buffer;
    }

    friend bool operator==(const BufferOrView &l, const BufferView &r) {
      return l.view() == r;
    }

   private:
    boost::variant<BufferView, Buffer, Moved> variant_;
  };
}  // namespace trielog::common

template <>
struct fmt::formatter<trielog::common::BufferOrView>
    : fmt::formatter<trielog::common::BufferView> {
  template <typename FormatContext>
  auto format(const trielog::common::BufferOrView &value,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<trielog::common::BufferView>::format(value.view(),
                                                               ctx);
  }
};
