// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license,
// as noted in the LICENSE file.

#include "Logger.hpp"

namespace logging {

ScopedMdc::ScopedMdc(const std::string& key, const std::string& val) : key_{key} { MDC_PUT(key, val); }
ScopedMdc::~ScopedMdc() { MDC_REMOVE(key_); }

}  // namespace logging

thread_local uint64_t cloak_seq = 0;
uint64_t getSeq() { return cloak_seq++; }

logging::Logger CLOAK_LOG = logging::getLogger("cloak");
logging::Logger RESOURCE_LOG = logging::getLogger("cloak.resource");
logging::Logger MERKLE_LOG = logging::getLogger("cloak.merkle");
logging::Logger COMPLIANCE_LOG = logging::getLogger("cloak.compliance");
logging::Logger LOGIC_LOG = logging::getLogger("cloak.logic");
logging::Logger PROVER_LOG = logging::getLogger("cloak.prover");
logging::Logger ENCRYPTION_LOG = logging::getLogger("cloak.encryption");
