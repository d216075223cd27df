// Voile
//
// Copyright (c) 2023 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "gtest/gtest.h"

#include "endianness.hpp"
#include "scope_exit.hpp"

#include <stdexcept>

namespace {

using namespace voile::util;

using testing::InitGoogleTest;

TEST(endianness, big_endian_u64) {
  const auto buf = toBigEndianArrayBuffer(std::uint64_t{0x0102030405060708});
  ASSERT_EQ((std::array<std::uint8_t, 8>{1, 2, 3, 4, 5, 6, 7, 8}), buf);
  ASSERT_EQ(0x0102030405060708u, fromBigEndianBuffer<std::uint64_t>(buf.data()));
}

TEST(endianness, big_endian_u16) {
  const auto buf = toBigEndianArrayBuffer(std::uint16_t{10000});
  ASSERT_EQ(0x27, buf[0]);
  ASSERT_EQ(0x10, buf[1]);
  ASSERT_EQ(10000, fromBigEndianBuffer<std::uint16_t>(buf.data()));
}

TEST(scope_exit, runs_on_scope_exit) {
  auto called = false;
  {
    auto s = ScopeExit{[&]() { called = true; }};
    ASSERT_FALSE(called);
  }
  ASSERT_TRUE(called);
}

TEST(scope_exit, runs_when_an_exception_propagates) {
  auto called = false;
  try {
    auto s = ScopeExit{[&]() { called = true; }};
    throw std::runtime_error{"leaving"};
  } catch (const std::runtime_error&) {
  }
  ASSERT_TRUE(called);
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
