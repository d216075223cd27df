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

#include "voile/exit_note.hpp"

#include <algorithm>
#include <chrono>

#include "Logger.hpp"
#include "kvstream.h"
#include "openssl_crypto.hpp"
#include "voile/errors.hpp"

namespace voile {

namespace {

uint64_t nowSeconds() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

template <typename Array>
void append(Bytes& out, const Array& a) {
  out.insert(out.end(), a.begin(), a.end());
}

// Cursor over a sealed payload. Every read checks the remaining length.
class Reader {
 public:
  explicit Reader(const Bytes& buf) : buf_{buf} {}

  const uint8_t* take(size_t n, const char* what) {
    if (buf_.size() - pos_ < n) throw InvalidExitNote(std::string{"truncated note payload at "} + what);
    const auto* p = buf_.data() + pos_;
    pos_ += n;
    return p;
  }

  uint8_t u8(const char* what) { return *take(1, what); }
  uint64_t u64(const char* what) { return util::fromBigEndianBuffer<uint64_t>(take(8, what)); }

  Bytes32 bytes32(const char* what) {
    Bytes32 out;
    const auto* p = take(out.size(), what);
    std::copy(p, p + out.size(), out.begin());
    return out;
  }

  ExitTerms terms() {
    size_t consumed = 0;
    auto t = decodeTerms(buf_.data() + pos_, buf_.size() - pos_, consumed);
    pos_ += consumed;
    return t;
  }

  bool done() const { return pos_ == buf_.size(); }

 private:
  const Bytes& buf_;
  size_t pos_ = 0;
};

}  // namespace

NoteId computeNoteId(const NoteFields& fields, const Blinding& blinding) {
  return LabeledHash{"voile.note-id"}
      .addU64(fields.amount)
      .add(fields.owner)
      .add(encodeTerms(fields.terms))
      .add(blinding)
      .finish();
}

ExitNote::ExitNote(const NoteFields& fields, const Blinding& blinding, uint64_t created_at)
    : fields_{fields}, blinding_{blinding}, id_{computeNoteId(fields, blinding)}, created_at_{created_at} {}

ExitNote ExitNote::create(uint64_t amount, const Bytes& owner, const ExitTerms& terms) {
  auto fields = NoteFields::make(amount, owner, terms);
  auto note = ExitNote{fields, util::openssl_utils::randomArray<std::tuple_size_v<Blinding>>(), nowSeconds()};
  LOG_DEBUG(COMMIT_LOG, "created note" << KVLOG(amount, terms) << " id: " << toHex(note.id()));
  return note;
}

ExitNote ExitNote::fromParts(const NoteFields& fields, const Blinding& blinding, uint64_t created_at) {
  if (fields.amount == 0) throw InvalidExitNote("amount must be greater than zero");
  validateTerms(fields.terms);
  return ExitNote{fields, blinding, created_at};
}

Bytes ExitNote::serialize() const {
  Bytes out;
  out.push_back(SERIALIZATION_VERSION);
  append(out, util::toBigEndianArrayBuffer(fields_.amount));
  append(out, fields_.owner);
  append(out, encodeTerms(fields_.terms));
  append(out, blinding_);
  append(out, util::toBigEndianArrayBuffer(created_at_));
  return out;
}

ExitNote ExitNote::deserialize(const Bytes& payload) {
  Reader r{payload};
  const auto version = r.u8("version");
  if (version != SERIALIZATION_VERSION) {
    throw InvalidExitNote("unsupported note payload version " + std::to_string(version));
  }
  NoteFields fields;
  fields.amount = r.u64("amount");
  fields.owner = r.bytes32("owner");
  fields.terms = r.terms();
  const auto blinding = r.bytes32("blinding");
  const auto created_at = r.u64("created_at");
  if (!r.done()) throw InvalidExitNote("trailing bytes after note payload");
  return fromParts(fields, blinding, created_at);
}

EncryptedNote ExitNote::encrypt(const EncryptionKey& key) const { return voile::encrypt(serialize(), key); }

ExitNote ExitNote::decrypt(const EncryptedNote& encrypted, const EncryptionKey& key) {
  return deserialize(voile::decrypt(encrypted, key));
}

std::ostream& operator<<(std::ostream& os, const ExitNote& note) {
  return os << "ExitNote{id: " << toHex(note.id()) << ", amount: " << note.amount() << ", owner: " << toHex(note.owner())
            << ", terms: " << note.terms() << ", created_at: " << note.createdAt() << "}";
}

}  // namespace voile
