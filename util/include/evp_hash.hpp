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
#include <utility>

#include <openssl/evp.h>

#include "assertUtils.hpp"

namespace voile {
namespace util {
namespace detail {

// A simple wrapper class around OpenSSL versions > 1.1.1 that implements EVP hash functions.
template <const EVP_MD* (*EVPMethod)(), size_t DIGEST_SIZE_IN_BYTES>
class EVPHash {
 public:
  static constexpr size_t SIZE_IN_BYTES = DIGEST_SIZE_IN_BYTES;
  typedef std::array<uint8_t, SIZE_IN_BYTES> Digest;

  EVPHash() noexcept : ctx_(EVP_MD_CTX_new()) { VoileAssert(ctx_ != nullptr); }

  ~EVPHash() noexcept {
    if (ctx_) {
      EVP_MD_CTX_free(ctx_);
    }
  }

  EVPHash(EVPHash&& other) noexcept : ctx_{other.ctx_}, updating_{other.updating_} { other.ctx_ = nullptr; }

  EVPHash& operator=(EVPHash&& other) noexcept {
    if (this != &other) {
      if (ctx_) EVP_MD_CTX_free(ctx_);
      ctx_ = std::exchange(other.ctx_, nullptr);
      updating_ = other.updating_;
    }
    return *this;
  }

  EVPHash(const EVPHash&) = delete;
  EVPHash& operator=(const EVPHash&) = delete;

  // Hash a single buffer. Use init()/update()/finish() to hash several buffers.
  Digest digest(const void* buf, size_t size) noexcept {
    init();
    update(buf, size);
    return finish();
  }

  void init() noexcept {
    VoileAssert(!updating_);
    VoileAssert(EVP_MD_CTX_reset(ctx_) == 1);
    VoileAssert(EVP_DigestInit_ex(ctx_, EVPMethod(), nullptr) == 1);
    updating_ = true;
  }

  void update(const void* buf, size_t size) noexcept {
    VoileAssert(updating_);
    VoileAssert(EVP_DigestUpdate(ctx_, buf, size) == 1);
  }

  // Convenience for any contiguous byte container (std::array, std::vector, std::string).
  template <typename Span>
  void update(const Span& span) noexcept {
    update(span.data(), span.size());
  }

  Digest finish() noexcept {
    VoileAssert(updating_);
    Digest digest;
    unsigned int _digest_len;
    VoileAssert(EVP_DigestFinal_ex(ctx_, digest.data(), &_digest_len) == 1);
    VoileAssertEQ(_digest_len, SIZE_IN_BYTES);
    updating_ = false;
    return digest;
  }

 private:
  EVP_MD_CTX* ctx_;
  bool updating_ = false;
};

}  // namespace detail
}  // namespace util
}  // namespace voile
