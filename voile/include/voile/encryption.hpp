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

#include <array>
#include <cstdint>
#include <string>

#include "types.hpp"

namespace voile {

// A 32-byte symmetric secret for sealing notes.
class EncryptionKey {
 public:
  static constexpr size_t SIZE = 32;

  // Fresh key from the CSPRNG.
  static EncryptionKey generate();

  // Throw InvalidKey unless given exactly 32 bytes.
  static EncryptionKey fromBytes(const uint8_t* data, size_t size);
  static EncryptionKey fromBytes(const Bytes& bytes) { return fromBytes(bytes.data(), bytes.size()); }
  static EncryptionKey fromHex(const std::string& hex);

  const Bytes32& bytes() const { return key_; }

 private:
  explicit EncryptionKey(const Bytes32& key) : key_{key} {}

  Bytes32 key_;
};

using EncryptionNonce = std::array<uint8_t, 24>;
using MacTag = std::array<uint8_t, 32>;

// Wire layout: nonce(24) || ciphertext || mac(32).
struct EncryptedNote {
  static constexpr size_t OVERHEAD = sizeof(EncryptionNonce) + sizeof(MacTag);

  EncryptionNonce nonce{};
  Bytes ciphertext;
  MacTag mac{};

  Bytes serialize() const;

  // Throws DecryptionError if the input is shorter than nonce plus MAC.
  static EncryptedNote deserialize(const Bytes& wire);
};

// Encrypts under a fresh random nonce and authenticates nonce || ciphertext.
EncryptedNote encrypt(const Bytes& plaintext, const EncryptionKey& key);

// Verifies the MAC before decrypting. Throws DecryptionError on any mismatch.
Bytes decrypt(const EncryptedNote& encrypted, const EncryptionKey& key);

// The unauthenticated keystream cipher underneath encrypt/decrypt. XORs data with
// H("voile.keystream" || k_enc || nonce || counter) blocks. Applying it twice restores the input.
Bytes applyKeystream(const EncryptionKey& key, const EncryptionNonce& nonce, const Bytes& data);

}  // namespace voile
