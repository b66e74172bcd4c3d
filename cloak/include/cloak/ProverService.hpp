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

#pragma once

#include <atomic>
#include <chrono>
#include <future>
#include <memory>

#include "cloak/ProofEngine.hpp"
#include "thread_pool.hpp"

namespace cloak {

/**
 * Runs prove() calls of a proof engine on a fixed set of worker threads.
 *
 * At most max_pending jobs may be queued or running; submit() refuses more with ProofEngineFailure instead of
 * blocking. A job whose caller gave up waiting keeps running until the engine returns, and its result is dropped.
 */
class ProverService {
 public:
  ProverService(std::shared_ptr<IProofEngine> engine, unsigned int worker_threads, size_t max_pending);
  ProverService(const ProverService&) = delete;
  ProverService& operator=(const ProverService&) = delete;

  std::future<Receipt> submit(Bytes input, Bytes guest_binary);

  // Blocks until the receipt is ready.
  Receipt prove(const Bytes& input, const Bytes& guest_binary);

  // Throws ProveTimeout if no receipt is ready within timeout.
  Receipt proveWithTimeout(const Bytes& input, const Bytes& guest_binary, std::chrono::milliseconds timeout);

  // Jobs queued or running.
  size_t pending() const { return pending_; }
  size_t maxPending() const { return max_pending_; }

  IProofEngine& engine() { return *engine_; }

 private:
  Receipt run(uint64_t job_id, const Bytes& input, const Bytes& guest_binary);

  std::shared_ptr<IProofEngine> engine_;
  const size_t max_pending_;
  std::atomic_size_t pending_{0};
  std::atomic_uint64_t next_job_id_{0};
  // Last, so that workers are joined before the members they use go away.
  util::ThreadPool pool_;
};

}  // namespace cloak
