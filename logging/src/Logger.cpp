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

#include "Logger.hpp"

namespace logging {

ScopedMdc::ScopedMdc(const std::string& key, const std::string& val) : key_{key} { MDC_PUT(key, val); }
ScopedMdc::~ScopedMdc() { MDC_REMOVE(key_); }

}  // namespace logging

thread_local uint64_t voile_log_seq = 0;
uint64_t getSeq() { return voile_log_seq++; }

// globally defined loggers
logging::Logger VL = logging::getLogger("voile");
logging::Logger COMMIT_LOG = logging::getLogger("voile.commitment");
logging::Logger ENCRYPTION_LOG = logging::getLogger("voile.encryption");
logging::Logger PROOF_LOG = logging::getLogger("voile.proof");
logging::Logger VERIFIER_LOG = logging::getLogger("voile.verifier");
logging::Logger STORAGE_LOG = logging::getLogger("voile.storage");
logging::Logger CONFIG_LOG = logging::getLogger("voile.config");
