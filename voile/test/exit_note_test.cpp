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

#include "voile/errors.hpp"
#include "voile/exit_note.hpp"

#include <algorithm>
#include <sstream>

namespace {

using namespace voile;

using testing::InitGoogleTest;

const Bytes owner(32, 0xab);

Blinding filled(uint8_t b) {
  Blinding out;
  out.fill(b);
  return out;
}

bool contains(const Bytes& haystack, const Blinding& needle) {
  return std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end()) != haystack.end();
}

TEST(exit_note, create_validates_fields) {
  ASSERT_THROW(ExitNote::create(0, owner, Standard{}), InvalidExitNote);
  ASSERT_THROW(ExitNote::create(1, Bytes(16, 0), Standard{}), InvalidExitNote);
  ASSERT_THROW(ExitNote::create(1, owner, Custom{0, 10001}), InvalidExitNote);
  const auto note = ExitNote::create(500, owner, Delayed{100});
  ASSERT_EQ(500u, note.amount());
  ASSERT_EQ(ExitTerms{Delayed{100}}, note.terms());
  ASSERT_TRUE(std::equal(owner.begin(), owner.end(), note.owner().begin()));
  ASSERT_GT(note.createdAt(), 0u);
}

TEST(exit_note, same_fields_different_blinding_give_different_ids_and_commitments) {
  const auto a = ExitNote::create(1000000, owner, Standard{});
  const auto b = ExitNote::create(1000000, owner, Standard{});
  ASSERT_NE(a.blinding(), b.blinding());
  ASSERT_NE(a.id(), b.id());
  ASSERT_NE(a.commitment(), b.commitment());
}

TEST(exit_note, id_and_commitment_are_pure_functions_of_the_fields) {
  const auto fields = NoteFields::make(9, owner, Immediate{});
  const auto a = ExitNote::fromParts(fields, filled(5), 1);
  const auto b = ExitNote::fromParts(fields, filled(5), 2);
  ASSERT_EQ(a.id(), b.id());
  ASSERT_EQ(a.commitment(), b.commitment());
  ASSERT_EQ(a.commitment(), a.commitment());
  ASSERT_EQ(computeNoteId(fields, filled(5)), a.id());
  ASSERT_NE(a.id(), a.commitment().bytes());
}

TEST(exit_note, regression_vector) {
  const auto note = ExitNote::fromParts(NoteFields::make(1000000, Bytes(32, 0), Standard{}), filled(0x01), 0);
  ASSERT_EQ("0x185fc7499a6324b9c5a2bd8fa83ffc99eca4a0b4810b9acf9634045ca684ef11", note.commitment().toHex());
  ASSERT_EQ("0xe6f13efc03231e4b745ff3df1a90bbe4683dac4e3c6a4ae0a76fda9e7bf0606e", toHex(note.id()));
}

TEST(exit_note, verify_commitment) {
  const auto a = ExitNote::create(10, owner, Standard{});
  const auto b = ExitNote::create(10, owner, Standard{});
  ASSERT_TRUE(a.verifyCommitment(a.commitment()));
  ASSERT_FALSE(a.verifyCommitment(b.commitment()));
}

TEST(exit_note, sealed_payload_round_trip) {
  const auto note = ExitNote::create(123456789, owner, makeCustomTerms(250, 75));
  const auto payload = note.serialize();
  ASSERT_EQ(ExitNote::SERIALIZATION_VERSION, payload[0]);
  ASSERT_EQ(note, ExitNote::deserialize(payload));
}

TEST(exit_note, deserialize_rejects_malformed_payloads) {
  const auto payload = ExitNote::create(1, owner, Delayed{3}).serialize();

  auto badVersion = payload;
  badVersion[0] = 2;
  ASSERT_THROW(ExitNote::deserialize(badVersion), InvalidExitNote);

  for (size_t len = 0; len < payload.size(); ++len) {
    ASSERT_THROW(ExitNote::deserialize(Bytes(payload.begin(), payload.begin() + len)), InvalidExitNote)
        << "length " << len;
  }

  auto trailing = payload;
  trailing.push_back(0);
  ASSERT_THROW(ExitNote::deserialize(trailing), InvalidExitNote);

  auto zeroAmount = payload;
  std::fill(zeroAmount.begin() + 1, zeroAmount.begin() + 9, 0);
  ASSERT_THROW(ExitNote::deserialize(zeroAmount), InvalidExitNote);
}

TEST(exit_note, encrypt_decrypt_round_trip) {
  const auto key = EncryptionKey::generate();
  const auto note = ExitNote::create(42, owner, Immediate{});
  const auto sealed = note.encrypt(key);
  ASSERT_FALSE(contains(sealed.serialize(), note.blinding()));
  const auto opened = ExitNote::decrypt(sealed, key);
  ASSERT_EQ(note, opened);
  ASSERT_EQ(note.commitment(), opened.commitment());
  ASSERT_THROW(ExitNote::decrypt(sealed, EncryptionKey::generate()), DecryptionError);
}

TEST(exit_note, printed_form_hides_the_blinding) {
  const auto note = ExitNote::fromParts(NoteFields::make(7, owner, Standard{}), filled(0xcd), 0);
  std::ostringstream os;
  os << note;
  ASSERT_EQ(std::string::npos, os.str().find(toHex(note.blinding()).substr(2)));
  ASSERT_NE(std::string::npos, os.str().find("amount: 7"));
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
