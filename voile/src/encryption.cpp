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

#include "voile/encryption.hpp"

#include <algorithm>

#include "Logger.hpp"
#include "openssl_crypto.hpp"
#include "voile/errors.hpp"

namespace voile {

using util::openssl_utils::constantTimeEqual;
using util::openssl_utils::hmacSha3_256;

namespace {

Bytes32 encryptionSubkey(const EncryptionKey& key) { return LabeledHash{"voile.enc-key"}.add(key.bytes()).finish(); }

Bytes32 macSubkey(const EncryptionKey& key) { return LabeledHash{"voile.mac-key"}.add(key.bytes()).finish(); }

MacTag computeMac(const EncryptionKey& key, const EncryptionNonce& nonce, const Bytes& ciphertext) {
  const auto k_mac = macSubkey(key);
  return hmacSha3_256(
      k_mac.data(), k_mac.size(), {{nonce.data(), nonce.size()}, {ciphertext.data(), ciphertext.size()}});
}

}  // namespace

EncryptionKey EncryptionKey::generate() {
  return EncryptionKey{util::openssl_utils::randomArray<SIZE>()};
}

EncryptionKey EncryptionKey::fromBytes(const uint8_t* data, size_t size) {
  if (size != SIZE) throw InvalidKey("expected 32 bytes, got " + std::to_string(size));
  Bytes32 key;
  std::copy(data, data + size, key.begin());
  return EncryptionKey{key};
}

EncryptionKey EncryptionKey::fromHex(const std::string& hex) {
  Bytes bytes;
  try {
    bytes = util::unhex(hex);
  } catch (const std::invalid_argument& e) {
    throw InvalidKey(e.what());
  }
  return fromBytes(bytes);
}

Bytes EncryptedNote::serialize() const {
  Bytes out;
  out.reserve(OVERHEAD + ciphertext.size());
  out.insert(out.end(), nonce.begin(), nonce.end());
  out.insert(out.end(), ciphertext.begin(), ciphertext.end());
  out.insert(out.end(), mac.begin(), mac.end());
  return out;
}

EncryptedNote EncryptedNote::deserialize(const Bytes& wire) {
  if (wire.size() < OVERHEAD) {
    throw DecryptionError("encrypted note of " + std::to_string(wire.size()) + " bytes is shorter than " +
                          std::to_string(OVERHEAD));
  }
  EncryptedNote note;
  const auto ct_begin = wire.begin() + note.nonce.size();
  const auto ct_end = wire.end() - note.mac.size();
  std::copy(wire.begin(), ct_begin, note.nonce.begin());
  note.ciphertext.assign(ct_begin, ct_end);
  std::copy(ct_end, wire.end(), note.mac.begin());
  return note;
}

Bytes applyKeystream(const EncryptionKey& key, const EncryptionNonce& nonce, const Bytes& data) {
  const auto k_enc = encryptionSubkey(key);
  Bytes out(data.size());
  uint64_t counter = 0;
  for (size_t offset = 0; offset < data.size(); ++counter) {
    const auto block = LabeledHash{"voile.keystream"}.add(k_enc).add(nonce).addU64(counter).finish();
    for (size_t i = 0; i < block.size() && offset < data.size(); ++i, ++offset) {
      out[offset] = data[offset] ^ block[i];
    }
  }
  return out;
}

EncryptedNote encrypt(const Bytes& plaintext, const EncryptionKey& key) {
  EncryptedNote note;
  note.nonce = util::openssl_utils::randomArray<std::tuple_size_v<EncryptionNonce>>();
  note.ciphertext = applyKeystream(key, note.nonce, plaintext);
  note.mac = computeMac(key, note.nonce, note.ciphertext);
  LOG_TRACE(ENCRYPTION_LOG, "sealed " << plaintext.size() << " bytes");
  return note;
}

Bytes decrypt(const EncryptedNote& encrypted, const EncryptionKey& key) {
  const auto expected = computeMac(key, encrypted.nonce, encrypted.ciphertext);
  if (!constantTimeEqual(expected.data(), encrypted.mac.data(), expected.size())) {
    LOG_DEBUG(ENCRYPTION_LOG, "MAC mismatch on " << encrypted.ciphertext.size() << " byte ciphertext");
    throw DecryptionError("authentication tag mismatch");
  }
  return applyKeystream(key, encrypted.nonce, encrypted.ciphertext);
}

}  // namespace voile
