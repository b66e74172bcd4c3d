// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to
// the terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#define MDC_THREAD_KEY "thread"
#define MDC_OPERATION_KEY "op"
#define MDC_IMAGE_ID_KEY "img"
#define MDC_JOB_ID_KEY "job"

#include <cstdint>
#include <string>

uint64_t getSeq();

#ifndef USE_LOG4CPP
#include "Logging.hpp"
#else
#include "Logging4cplus.hpp"
#endif

extern logging::Logger CLOAK_LOG;
extern logging::Logger RESOURCE_LOG;
extern logging::Logger MERKLE_LOG;
extern logging::Logger COMPLIANCE_LOG;
extern logging::Logger LOGIC_LOG;
extern logging::Logger PROVER_LOG;
extern logging::Logger ENCRYPTION_LOG;

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

// Attach a key-value pair to every log line written from the enclosing scope.
#define SCOPED_MDC(k, v) logging::ScopedMdc __s_mdc__(k, v)
#define SCOPED_MDC_OP(v) logging::ScopedMdc __s_mdc_op__(MDC_OPERATION_KEY, v)
#define SCOPED_MDC_IMAGE_ID(v) logging::ScopedMdc __s_mdc_img__(MDC_IMAGE_ID_KEY, v)
#define SCOPED_MDC_JOB(v) logging::ScopedMdc __s_mdc_job__(MDC_JOB_ID_KEY, v)
