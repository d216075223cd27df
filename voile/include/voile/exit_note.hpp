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

#pragma once

#include <cstdint>
#include <ostream>

#include "commitment.hpp"
#include "encryption.hpp"
#include "exit_terms.hpp"
#include "types.hpp"

namespace voile {

using NoteId = Bytes32;

// An immutable private exit note. The blinding is drawn once at construction and is only ever
// written out inside an encrypted payload.
class ExitNote {
 public:
  static constexpr uint8_t SERIALIZATION_VERSION = 1;

  // Draws a fresh blinding from the CSPRNG and stamps the current time.
  // Throws InvalidExitNote on a zero amount, an owner that is not 32 bytes or out-of-range terms.
  static ExitNote create(uint64_t amount, const Bytes& owner, const ExitTerms& terms);

  // Rebuilds a note from known parts, e.g. for fixtures or after unsealing.
  static ExitNote fromParts(const NoteFields& fields, const Blinding& blinding, uint64_t created_at);

  uint64_t amount() const { return fields_.amount; }
  const Owner& owner() const { return fields_.owner; }
  const ExitTerms& terms() const { return fields_.terms; }
  const NoteFields& fields() const { return fields_; }
  const Blinding& blinding() const { return blinding_; }
  const NoteId& id() const { return id_; }
  uint64_t createdAt() const { return created_at_; }

  Commitment commitment() const { return Commitment::compute(fields_, blinding_); }
  bool verifyCommitment(const Commitment& c) const { return c.verify(fields_, blinding_); }

  // Sealed payload, blinding included. Only ever pass the result to encrypt().
  //   version(1) || amount(8) || owner(32) || terms || blinding(32) || created_at(8)
  Bytes serialize() const;

  // Throws InvalidExitNote on a version mismatch, truncation, trailing bytes or invalid fields.
  static ExitNote deserialize(const Bytes& payload);

  EncryptedNote encrypt(const EncryptionKey& key) const;

  // Throws DecryptionError on authentication failure and InvalidExitNote if the payload is malformed.
  static ExitNote decrypt(const EncryptedNote& encrypted, const EncryptionKey& key);

  bool operator==(const ExitNote& o) const {
    return id_ == o.id_ && blinding_ == o.blinding_ && created_at_ == o.created_at_;
  }
  bool operator!=(const ExitNote& o) const { return !(*this == o); }

 private:
  ExitNote(const NoteFields& fields, const Blinding& blinding, uint64_t created_at);

  NoteFields fields_;
  Blinding blinding_;
  NoteId id_;
  uint64_t created_at_;
};

// H("voile.note-id" || amount(8) || owner(32) || terms || blinding(32))
NoteId computeNoteId(const NoteFields& fields, const Blinding& blinding);

// Public view of a note. Never prints the blinding.
std::ostream& operator<<(std::ostream& os, const ExitNote& note);

}  // namespace voile
