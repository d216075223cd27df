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

#include <stdexcept>
#include <string>

namespace voile {

class VoileException : public std::runtime_error {
 public:
  explicit VoileException(const std::string& what) : std::runtime_error{what} {}
};

// Zero amount, bad owner or terms, or a malformed sealed note payload.
class InvalidExitNote : public VoileException {
 public:
  explicit InvalidExitNote(const std::string& what) : VoileException{"invalid exit note: " + what} {}
};

class InvalidKey : public VoileException {
 public:
  explicit InvalidKey(const std::string& what) : VoileException{"invalid key: " + what} {}
};

class InvalidCommitment : public VoileException {
 public:
  explicit InvalidCommitment(const std::string& what) : VoileException{"invalid commitment: " + what} {}
};

class InvalidProof : public VoileException {
 public:
  explicit InvalidProof(const std::string& what) : VoileException{"invalid proof: " + what} {}
};

// MAC mismatch or truncated ciphertext. No plaintext is ever returned alongside it.
class DecryptionError : public VoileException {
 public:
  explicit DecryptionError(const std::string& what) : VoileException{"decryption failed: " + what} {}
};

class ProofGenerationError : public VoileException {
 public:
  explicit ProofGenerationError(const std::string& what) : VoileException{"proof generation failed: " + what} {}
};

// The nullifier store reported a failure. The nullifier was not consumed.
class NullifierPersistenceError : public VoileException {
 public:
  explicit NullifierPersistenceError(const std::string& what)
      : VoileException{"nullifier persistence failed: " + what} {}
};

// The nullifier store did not answer in time. The outcome of the write is unknown.
class NullifierPersistenceTimeout : public VoileException {
 public:
  explicit NullifierPersistenceTimeout(const std::string& what)
      : VoileException{"nullifier persistence timed out: " + what} {}
};

class ConfigError : public VoileException {
 public:
  explicit ConfigError(const std::string& what) : VoileException{"configuration error: " + what} {}
};

}  // namespace voile
