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
//
// Thin wrapper over the few OpenSSL crypto primitives Voile needs besides
// hashing (see sha_hash.hpp): a CSPRNG, HMAC over SHA3-256 and a
// constant-time comparison.

#ifndef UTILS_OPENSSL_CRYPTO_HPP
#define UTILS_OPENSSL_CRYPTO_HPP

#include <array>
#include <climits>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace voile {
namespace util {
namespace openssl_utils {

static_assert(CHAR_BIT == 8);

constexpr int OPENSSL_SUCCESS = 1;
constexpr size_t HMAC_SHA3_256_SIZE = 32;

using HmacDigest = std::array<uint8_t, HMAC_SHA3_256_SIZE>;

// Fills buf with size bytes from OpenSSL's CSPRNG. Throws an
// UnexpectedOpenSSLCryptoFailureException if the generator is not seeded.
void randomBytes(uint8_t* buf, size_t size);

template <size_t N>
std::array<uint8_t, N> randomArray() {
  std::array<uint8_t, N> out;
  randomBytes(out.data(), out.size());
  return out;
}

// HMAC-SHA3-256 over the concatenation of the given parts.
HmacDigest hmacSha3_256(const uint8_t* key, size_t key_len, const std::vector<std::pair<const uint8_t*, size_t>>& parts);

// Compares two equally sized buffers in time independent of their contents.
bool constantTimeEqual(const uint8_t* a, const uint8_t* b, size_t size);

// Exception that may be thrown if a call into OpenSSL returns a failure
// unexpectedly.
class UnexpectedOpenSSLCryptoFailureException : public std::exception {
 private:
  std::string message;

 public:
  explicit UnexpectedOpenSSLCryptoFailureException(const std::string& what) : message(what) {}
  virtual const char* what() const noexcept override { return message.c_str(); }
};

}  // namespace openssl_utils
}  // namespace util
}  // namespace voile

#endif  // UTILS_OPENSSL_CRYPTO_HPP
