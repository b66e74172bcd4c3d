// Cloak
//
// Copyright (c) 2024 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the LICENSE
// file.

#include "cloak/ProverService.hpp"
#include "cloak/errors.hpp"
#include "assertUtils.hpp"
#include "Logger.hpp"
#include "kvstream.h"

namespace cloak {

ProverService::ProverService(std::shared_ptr<IProofEngine> engine, unsigned int worker_threads, size_t max_pending)
    : engine_{std::move(engine)}, max_pending_{max_pending}, pool_{worker_threads, "prover"} {
  CloakAssert(engine_ != nullptr);
  CloakAssertGT(max_pending_, 0u);
  LOG_INFO(PROVER_LOG, "Prover service started: " << KVLOG(worker_threads, max_pending));
}

std::future<Receipt> ProverService::submit(Bytes input, Bytes guest_binary) {
  size_t pending = pending_.load();
  do {
    if (pending >= max_pending_) {
      LOG_WARN(PROVER_LOG, "Rejecting proof request: " << KVLOG(pending, max_pending_));
      throw ProofEngineFailure("prover queue is full (" + std::to_string(max_pending_) + " jobs pending)");
    }
  } while (!pending_.compare_exchange_weak(pending, pending + 1));

  const uint64_t job_id = next_job_id_++;
  LOG_DEBUG(PROVER_LOG, "Proof job queued: " << KVLOG(job_id, input.size(), pool_.queued()));
  return pool_.async(
      [this, job_id](const Bytes& in, const Bytes& guest) { return run(job_id, in, guest); },
      std::move(input),
      std::move(guest_binary));
}

Receipt ProverService::run(uint64_t job_id, const Bytes& input, const Bytes& guest_binary) {
  SCOPED_MDC_JOB(std::to_string(job_id));
  struct PendingGuard {
    std::atomic_size_t& pending;
    ~PendingGuard() { pending--; }
  } guard{pending_};
  return engine_->prove(input, guest_binary);
}

Receipt ProverService::prove(const Bytes& input, const Bytes& guest_binary) {
  return submit(input, guest_binary).get();
}

Receipt ProverService::proveWithTimeout(const Bytes& input,
                                        const Bytes& guest_binary,
                                        std::chrono::milliseconds timeout) {
  auto future = submit(input, guest_binary);
  if (future.wait_for(timeout) != std::future_status::ready) {
    LOG_WARN(PROVER_LOG, "Abandoning proof job: " << KVLOG(timeout.count()));
    throw ProveTimeout("no receipt after " + std::to_string(timeout.count()) + "ms");
  }
  return future.get();
}

}  // namespace cloak
