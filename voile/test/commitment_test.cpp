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

#include "voile/commitment.hpp"
#include "voile/errors.hpp"

#include <set>

namespace {

using namespace voile;

using testing::InitGoogleTest;

Blinding filled(uint8_t b) {
  Blinding out;
  out.fill(b);
  return out;
}

const Bytes zeroOwner(32, 0x00);

// Fixed regression vector: amount 1000000, zero owner, Standard terms, blinding 0x01 x 32.
// Any change to this value breaks every commitment already published.
TEST(commitment, regression_vector) {
  const auto c = commit(1000000, zeroOwner, Standard{}, filled(0x01));
  ASSERT_EQ("0x185fc7499a6324b9c5a2bd8fa83ffc99eca4a0b4810b9acf9634045ca684ef11", c.toHex());
}

TEST(commitment, deterministic_for_the_same_inputs) {
  const auto fields = NoteFields::make(42, zeroOwner, Delayed{10});
  ASSERT_EQ(Commitment::compute(fields, filled(7)), Commitment::compute(fields, filled(7)));
}

TEST(commitment, hiding_different_blindings_give_different_commitments) {
  const auto fields = NoteFields::make(1000000, zeroOwner, Standard{});
  std::set<Commitment> seen;
  for (int b = 0; b < 32; ++b) {
    ASSERT_TRUE(seen.insert(Commitment::compute(fields, filled(static_cast<uint8_t>(b)))).second);
  }
}

TEST(commitment, every_field_changes_the_commitment) {
  const auto base = commit(1000, zeroOwner, Standard{}, filled(1));
  auto otherOwner = zeroOwner;
  otherOwner[31] = 1;
  auto otherBlinding = filled(1);
  otherBlinding[0] ^= 0x80;

  ASSERT_NE(base, commit(1001, zeroOwner, Standard{}, filled(1)));
  ASSERT_NE(base, commit(1000, otherOwner, Standard{}, filled(1)));
  ASSERT_NE(base, commit(1000, zeroOwner, Immediate{}, filled(1)));
  ASSERT_NE(base, commit(1000, zeroOwner, Delayed{0}, filled(1)));
  ASSERT_NE(base, commit(1000, zeroOwner, makeCustomTerms(0, 0), filled(1)));
  ASSERT_NE(base, commit(1000, zeroOwner, Standard{}, otherBlinding));
}

TEST(commitment, delayed_and_custom_parameters_are_bound) {
  ASSERT_NE(commit(5, zeroOwner, Delayed{1}, filled(1)), commit(5, zeroOwner, Delayed{2}, filled(1)));
  ASSERT_NE(commit(5, zeroOwner, makeCustomTerms(1, 2), filled(1)),
            commit(5, zeroOwner, makeCustomTerms(2, 1), filled(1)));
}

TEST(commitment, opening) {
  const auto fields = NoteFields::make(77, zeroOwner, Immediate{});
  const auto c = Commitment::compute(fields, filled(3));
  ASSERT_TRUE(c.verify(fields, filled(3)));
  ASSERT_FALSE(c.verify(fields, filled(4)));
  ASSERT_FALSE(c.verify(NoteFields::make(78, zeroOwner, Immediate{}), filled(3)));
}

TEST(commitment, rejects_zero_amount) {
  ASSERT_THROW(commit(0, zeroOwner, Standard{}, filled(1)), InvalidExitNote);
  ASSERT_THROW(Commitment::compute(NoteFields{}, filled(1)), InvalidExitNote);
}

TEST(commitment, rejects_owner_of_wrong_size) {
  ASSERT_THROW(commit(1, Bytes(31, 0), Standard{}, filled(1)), InvalidExitNote);
  ASSERT_THROW(commit(1, Bytes(33, 0), Standard{}, filled(1)), InvalidExitNote);
  ASSERT_THROW(commit(1, Bytes{}, Standard{}, filled(1)), InvalidExitNote);
}

TEST(commitment, rejects_out_of_range_custom_terms) {
  ASSERT_THROW(commit(1, zeroOwner, Custom{10001, 0}, filled(1)), InvalidExitNote);
}

TEST(commitment, parse_from_hex_and_bytes) {
  const auto c = commit(1000000, zeroOwner, Standard{}, filled(0x01));
  ASSERT_EQ(c, Commitment::fromHex(c.toHex()));
  ASSERT_EQ(c, Commitment::fromHex(c.toHex().substr(2)));
  const Bytes raw(c.bytes().begin(), c.bytes().end());
  ASSERT_EQ(c, Commitment::fromBytes(raw));
}

TEST(commitment, parse_rejects_bad_input) {
  ASSERT_THROW(Commitment::fromBytes(Bytes(31, 0)), InvalidCommitment);
  ASSERT_THROW(Commitment::fromBytes(Bytes(33, 0)), InvalidCommitment);
  ASSERT_THROW(Commitment::fromHex("0x1234"), InvalidCommitment);
  ASSERT_THROW(Commitment::fromHex(std::string(64, 'g')), InvalidCommitment);
  ASSERT_THROW(Commitment::fromHex(std::string(63, '0')), InvalidCommitment);
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
