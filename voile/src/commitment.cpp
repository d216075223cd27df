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

#include "voile/commitment.hpp"

#include <algorithm>

#include "Logger.hpp"
#include "kvstream.h"
#include "openssl_crypto.hpp"
#include "voile/errors.hpp"

namespace voile {

NoteFields NoteFields::make(uint64_t amount, const Bytes& owner, const ExitTerms& terms) {
  if (amount == 0) throw InvalidExitNote("amount must be greater than zero");
  if (owner.size() != Owner{}.size()) {
    throw InvalidExitNote("owner must be 32 bytes, got " + std::to_string(owner.size()));
  }
  validateTerms(terms);
  NoteFields fields;
  fields.amount = amount;
  std::copy(owner.begin(), owner.end(), fields.owner.begin());
  fields.terms = terms;
  return fields;
}

Commitment Commitment::compute(const NoteFields& fields, const Blinding& blinding) {
  if (fields.amount == 0) throw InvalidExitNote("amount must be greater than zero");
  auto digest = LabeledHash{"voile.commit.v1"}
                    .addU64(fields.amount)
                    .add(fields.owner)
                    .add(encodeTerms(fields.terms))
                    .add(blinding)
                    .finish();
  auto c = Commitment{digest};
  LOG_TRACE(COMMIT_LOG, KVLOG(fields.amount, fields.terms) << " commitment: " << c);
  return c;
}

Commitment Commitment::fromBytes(const uint8_t* data, size_t size) {
  if (size != SIZE) throw InvalidCommitment("expected 32 bytes, got " + std::to_string(size));
  Bytes32 b;
  std::copy(data, data + size, b.begin());
  return Commitment{b};
}

Commitment Commitment::fromHex(const std::string& hex) {
  Bytes bytes;
  try {
    bytes = util::unhex(hex);
  } catch (const std::invalid_argument& e) {
    throw InvalidCommitment(e.what());
  }
  return fromBytes(bytes);
}

bool Commitment::verify(const NoteFields& fields, const Blinding& blinding) const {
  const auto expected = compute(fields, blinding);
  return util::openssl_utils::constantTimeEqual(expected.bytes_.data(), bytes_.data(), SIZE);
}

Commitment commit(uint64_t amount, const Bytes& owner, const ExitTerms& terms, const Blinding& blinding) {
  return Commitment::compute(NoteFields::make(amount, owner, terms), blinding);
}

}  // namespace voile
