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

#define MDC_THREAD_KEY "thread"
#define MDC_NULLIFIER_KEY "nullifier"
#define MDC_COMMITMENT_KEY "commitment"

#include <cstdint>
#include <string>

uint64_t getSeq();

#ifndef USE_LOG4CPP
#include "Logging.hpp"
#else
#include "Logging4cplus.hpp"
#endif

extern logging::Logger VL;
extern logging::Logger COMMIT_LOG;
extern logging::Logger ENCRYPTION_LOG;
extern logging::Logger PROOF_LOG;
extern logging::Logger VERIFIER_LOG;
extern logging::Logger STORAGE_LOG;
extern logging::Logger CONFIG_LOG;

namespace logging {

Logger getLogger(const std::string& name);
void initLogger(const std::string& configFileName);

class ScopedMdc {
 public:
  ScopedMdc(const std::string& key, const std::string& val);
  ~ScopedMdc();

 private:
  const std::string key_;
};

}  // namespace logging

// Attach a key-value pair to every log line emitted in the enclosing scope.
#define SCOPED_MDC(k, v) logging::ScopedMdc __s_mdc__(k, v)
#define SCOPED_MDC_NULLIFIER(v) logging::ScopedMdc __s_mdc_nullifier__(MDC_NULLIFIER_KEY, v)
#define SCOPED_MDC_COMMITMENT(v) logging::ScopedMdc __s_mdc_commitment__(MDC_COMMITMENT_KEY, v)
