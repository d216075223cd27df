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

#include "openssl_crypto.hpp"

#include <memory>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "memory.hpp"

namespace voile {
namespace util {
namespace openssl_utils {

using UniqueHmacContext = custom_deleter_unique_ptr<HMAC_CTX, HMAC_CTX_free>;

void randomBytes(uint8_t* buf, size_t size) {
  if (size == 0) return;
  if (RAND_bytes(buf, static_cast<int>(size)) != OPENSSL_SUCCESS) {
    throw UnexpectedOpenSSLCryptoFailureException("OpenSSL Crypto unexpectedly failed to generate random bytes.");
  }
}

HmacDigest hmacSha3_256(const uint8_t* key,
                        size_t key_len,
                        const std::vector<std::pair<const uint8_t*, size_t>>& parts) {
  UniqueHmacContext ctx(HMAC_CTX_new());
  if (!ctx) {
    throw UnexpectedOpenSSLCryptoFailureException("OpenSSL Crypto unexpectedly failed to allocate an HMAC context.");
  }
  if (HMAC_Init_ex(ctx.get(), key, static_cast<int>(key_len), EVP_sha3_256(), nullptr) != OPENSSL_SUCCESS) {
    throw UnexpectedOpenSSLCryptoFailureException("OpenSSL Crypto unexpectedly failed to initialize HMAC.");
  }
  for (const auto& [data, len] : parts) {
    if (HMAC_Update(ctx.get(), data, len) != OPENSSL_SUCCESS) {
      throw UnexpectedOpenSSLCryptoFailureException("OpenSSL Crypto unexpectedly failed to update HMAC.");
    }
  }
  HmacDigest out;
  unsigned int out_len = 0;
  if (HMAC_Final(ctx.get(), out.data(), &out_len) != OPENSSL_SUCCESS || out_len != out.size()) {
    throw UnexpectedOpenSSLCryptoFailureException("OpenSSL Crypto unexpectedly failed to finalize HMAC.");
  }
  return out;
}

bool constantTimeEqual(const uint8_t* a, const uint8_t* b, size_t size) { return CRYPTO_memcmp(a, b, size) == 0; }

}  // namespace openssl_utils
}  // namespace util
}  // namespace voile
