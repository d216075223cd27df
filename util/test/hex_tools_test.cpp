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

#include "hex_tools.h"

#include <array>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using namespace voile::util;

using testing::InitGoogleTest;

TEST(hex_tools, unhex_empty) { ASSERT_TRUE(unhex("").empty()); }

TEST(hex_tools, unhex_lower_0x_empty) { ASSERT_TRUE(unhex("0x").empty()); }

TEST(hex_tools, unhex_capital_0X_empty) { ASSERT_TRUE(unhex("0X").empty()); }

TEST(hex_tools, unhex_odd_size) { ASSERT_THROW(unhex("123"), std::invalid_argument); }

TEST(hex_tools, unhex_odd_size_after_prefix) { ASSERT_THROW(unhex("0x123"), std::invalid_argument); }

TEST(hex_tools, unhex_invalid_char_with_0x) { ASSERT_THROW(unhex("0x12ck"), std::invalid_argument); }

TEST(hex_tools, unhex_invalid_char_without_0x) { ASSERT_THROW(unhex("12ck"), std::invalid_argument); }

TEST(hex_tools, unhex_0x_in_the_middle) { ASSERT_THROW(unhex("126a0x"), std::invalid_argument); }

TEST(hex_tools, unhex_mixed_case_with_prefix) {
  const auto bytes = unhex("0x61646A");
  ASSERT_EQ(3, bytes.size());
  ASSERT_EQ('a', bytes[0]);
  ASSERT_EQ('d', bytes[1]);
  ASSERT_EQ('j', bytes[2]);
}

TEST(hex_tools, unhex_without_prefix) {
  const auto bytes = unhex("00ff10");
  ASSERT_EQ((std::vector<uint8_t>{0x00, 0xff, 0x10}), bytes);
}

TEST(hex_tools, buffer_to_hex_is_lowercase) {
  const uint8_t data[] = {0x00, 0xAB, 0x0f};
  ASSERT_EQ("00ab0f", bufferToHex(data, sizeof(data)));
  ASSERT_EQ("0x00ab0f", bufferToHex(data, sizeof(data), true));
}

TEST(hex_tools, to_hex_container) {
  const auto arr = std::array<uint8_t, 2>{0xde, 0xad};
  ASSERT_EQ("0xdead", toHex(arr, true));
  ASSERT_EQ(arr.size(), unhex(toHex(arr, true)).size());
}

TEST(hex_tools, hex_print_buffer_restores_stream_flags) {
  const uint8_t data[] = {0x0a};
  std::ostringstream os;
  os << HexPrintBuffer{data, sizeof(data)} << " " << 10;
  ASSERT_EQ("0x0a 10", os.str());
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
