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
#include <string>

#include "exit_terms.hpp"
#include "types.hpp"

namespace voile {

using Blinding = Bytes32;
using Owner = Bytes32;

// The note fields a commitment binds, without the blinding.
struct NoteFields {
  uint64_t amount = 0;
  Owner owner{};
  ExitTerms terms = Standard{};

  // Throws InvalidExitNote on a zero amount, an owner that is not 32 bytes or out-of-range terms.
  static NoteFields make(uint64_t amount, const Bytes& owner, const ExitTerms& terms);
};

// A public 32-byte value that hides the note fields and binds the note owner to them:
//   H("voile.commit.v1" || amount(8) || owner(32) || terms_encoding || blinding(32))
class Commitment {
 public:
  static constexpr size_t SIZE = 32;

  // Throws InvalidExitNote on invalid fields.
  static Commitment compute(const NoteFields& fields, const Blinding& blinding);

  // Throw InvalidCommitment unless the input holds exactly 32 bytes.
  static Commitment fromBytes(const uint8_t* data, size_t size);
  static Commitment fromBytes(const Bytes& bytes) { return fromBytes(bytes.data(), bytes.size()); }
  static Commitment fromHex(const std::string& hex);

  explicit Commitment(const Bytes32& bytes) : bytes_{bytes} {}

  // Opening check: recomputes the commitment from the fields and blinding.
  bool verify(const NoteFields& fields, const Blinding& blinding) const;

  const Bytes32& bytes() const { return bytes_; }
  std::string toHex() const { return voile::toHex(bytes_); }

  bool operator==(const Commitment& o) const { return bytes_ == o.bytes_; }
  bool operator!=(const Commitment& o) const { return bytes_ != o.bytes_; }
  bool operator<(const Commitment& o) const { return bytes_ < o.bytes_; }

 private:
  Bytes32 bytes_;
};

// Free-function form of Commitment::compute taking the owner as raw bytes.
Commitment commit(uint64_t amount, const Bytes& owner, const ExitTerms& terms, const Blinding& blinding);

inline std::ostream& operator<<(std::ostream& os, const Commitment& c) { return os << c.toHex(); }

}  // namespace voile
