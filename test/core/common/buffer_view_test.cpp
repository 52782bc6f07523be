/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/buffer_view.hpp"

#include <gtest/gtest.h>

using namespace trielog::common;
using Span = std::span<const uint8_t>;

TEST(BufferView, Constructor_default) {
  BufferView v;

  EXPECT_EQ(v.toHex(), "");
  EXPECT_EQ(v.size(), 0);
}

TEST(BufferView, Constructor_from_span) {
  uint8_t c_arr[] = {1, 2, 3, 4, 5};
  Span span(std::begin(c_arr), std::end(c_arr));

  BufferView view_span(span);

  EXPECT_EQ(view_span.toHex(), "0102030405");
  EXPECT_EQ(view_span.size(), std::size(c_arr));
}

TEST(BufferView, Constructor_from_vector) {
  std::vector<uint8_t> vec = {1, 2, 3, 4, 5};

  BufferView view_vec(vec);

  EXPECT_EQ(view_vec.toHex(), "0102030405");
  EXPECT_EQ(view_vec.size(), vec.size());
}

TEST(BufferView, Constructor_from_array) {
  std::array<uint8_t, 5> arr = {1, 2, 3, 4, 5};

  BufferView view_arr(arr);

  EXPECT_EQ(view_arr.toHex(), "0102030405");
  EXPECT_EQ(view_arr.size(), arr.size());
}

TEST(BufferView, DropFirst) {
  std::vector<uint8_t> vec = {1, 2, 3, 4, 5};
  BufferView view(vec);

  view.dropFirst(2);

  EXPECT_EQ(view.toHex(), "030405");
}

/**
 * @given views of different content
 * @when compare them
 * @then views are ordered lexicographically, shorter prefix goes first
 */
TEST(BufferView, LexicographicalOrder) {
  std::vector<uint8_t> a = {1, 2};
  std::vector<uint8_t> ab = {1, 2, 3};
  std::vector<uint8_t> b = {1, 3};

  EXPECT_LT(BufferView(a), BufferView(ab));
  EXPECT_LT(BufferView(ab), BufferView(b));
  EXPECT_EQ(BufferView(a), BufferView(std::vector<uint8_t>{1, 2}));
  EXPECT_TRUE(startsWith(ab, a));
  EXPECT_FALSE(startsWith(a, ab));
}

TEST(BufferView, Format) {
  std::vector<uint8_t> small = {1, 2, 3};
  std::vector<uint8_t> big = {1, 2, 3, 4, 5, 6, 7};

  EXPECT_EQ(fmt::format("{}", BufferView()), "<empty>");
  EXPECT_EQ(fmt::format("{}", BufferView(small)), "0x010203");
  EXPECT_EQ(fmt::format("{}", BufferView(big)), "0x0102…0607");
  EXPECT_EQ(fmt::format("{:l}", BufferView(big)), "0x01020304050607");
}
