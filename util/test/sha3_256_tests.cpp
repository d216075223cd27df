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
#include "sha_hash.hpp"

#include <algorithm>
#include <string>

namespace {

using namespace voile::util;

using testing::InitGoogleTest;

SHA3_256::Digest toDigest(const std::string& hex) {
  const auto bytes = unhex(hex);
  SHA3_256::Digest d{};
  EXPECT_EQ(d.size(), bytes.size());
  std::copy(bytes.begin(), bytes.end(), d.begin());
  return d;
}

// Known answers from the NIST SHA3-256 test vectors.
TEST(sha3_256_test, known_answers) {
  auto sha3 = SHA3_256();
  auto hash = sha3.digest("", 0);
  ASSERT_EQ(toDigest("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a"), hash);
  // The context can be reused after finish().
  hash = sha3.digest("", 0);
  ASSERT_EQ(toDigest("a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a"), hash);

  hash = sha3.digest("abc", 3);
  ASSERT_EQ(toDigest("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532"), hash);
}

TEST(sha3_256_test, incremental_update_matches_single_digest) {
  auto sha3 = SHA3_256();
  const auto whole = sha3.digest("artistREM", 9);

  sha3.init();
  sha3.update("artist", 6);
  sha3.update(std::string{"REM"});
  ASSERT_EQ(whole, sha3.finish());
}

TEST(sha3_256_test, move_keeps_context) {
  auto sha3 = SHA3_256();
  sha3.init();
  sha3.update("ab", 2);
  auto moved = std::move(sha3);
  moved.update("c", 1);
  ASSERT_EQ(toDigest("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532"), moved.finish());
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
