// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "gtest/gtest.h"

#include "wire.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace cloak::wire;
using Bytes = std::vector<uint8_t>;

template <typename T>
T decodeAll(const Bytes& buf) {
  const uint8_t* start = buf.data();
  const uint8_t* end = buf.data() + buf.size();
  T t{};
  deserialize(start, end, t);
  expectEnd(start, end);
  return t;
}

TEST(wire, integers_are_big_endian) {
  Bytes out;
  serialize(out, uint32_t{0x01020304});
  serialize(out, uint16_t{0xa0b0});
  ASSERT_EQ((Bytes{1, 2, 3, 4, 0xa0, 0xb0}), out);

  const uint8_t* start = out.data();
  uint32_t a = 0;
  uint16_t b = 0;
  deserialize(start, out.data() + out.size(), a);
  deserialize(start, out.data() + out.size(), b);
  ASSERT_EQ(0x01020304u, a);
  ASSERT_EQ(0xa0b0u, b);
}

TEST(wire, negative_integers) {
  Bytes out;
  serialize(out, int64_t{-2});
  ASSERT_EQ(8u, out.size());
  ASSERT_EQ(-2, decodeAll<int64_t>(out));
}

TEST(wire, bool_must_be_zero_or_one) {
  ASSERT_TRUE(decodeAll<bool>(Bytes{1}));
  ASSERT_FALSE(decodeAll<bool>(Bytes{0}));
  ASSERT_THROW(decodeAll<bool>(Bytes{2}), BadDataError);
}

TEST(wire, byte_vectors_are_length_prefixed) {
  Bytes out;
  serialize(out, Bytes{7, 8, 9});
  ASSERT_EQ((Bytes{0, 0, 0, 3, 7, 8, 9}), out);
  ASSERT_EQ((Bytes{7, 8, 9}), decodeAll<Bytes>(out));
}

TEST(wire, byte_arrays_are_raw) {
  Bytes out;
  serialize(out, std::array<uint8_t, 3>{1, 2, 3});
  ASSERT_EQ((Bytes{1, 2, 3}), out);
  ASSERT_EQ((std::array<uint8_t, 3>{1, 2, 3}), (decodeAll<std::array<uint8_t, 3>>(out)));
}

TEST(wire, strings_and_nested_lists) {
  Bytes out;
  serialize(out, std::vector<std::string>{"cloak", ""});
  ASSERT_EQ((std::vector<std::string>{"cloak", ""}), decodeAll<std::vector<std::string>>(out));
}

TEST(wire, optionals) {
  Bytes empty;
  serialize(empty, std::optional<uint32_t>{});
  ASSERT_EQ(Bytes{0}, empty);
  ASSERT_FALSE(decodeAll<std::optional<uint32_t>>(empty).has_value());

  Bytes present;
  serialize(present, std::optional<uint32_t>{5});
  ASSERT_EQ((Bytes{1, 0, 0, 0, 5}), present);
  ASSERT_EQ(5u, decodeAll<std::optional<uint32_t>>(present).value());
}

TEST(wire, short_input) {
  ASSERT_THROW(decodeAll<uint32_t>(Bytes{0, 0, 1}), NoDataLeftError);
  ASSERT_THROW(decodeAll<Bytes>(Bytes{0, 0, 0, 4, 1, 2}), NoDataLeftError);
  ASSERT_THROW(decodeAll<std::string>(Bytes{0, 0}), NoDataLeftError);
}

TEST(wire, trailing_data) {
  ASSERT_THROW(decodeAll<uint16_t>(Bytes{0, 1, 2}), TrailingDataError);
  ASSERT_NO_THROW(expectEnd(nullptr, nullptr));
}

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
