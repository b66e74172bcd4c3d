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
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

// Based on Mastering the C++17 STL, page 204:
// https://books.google.bg/books?id=zJlGDwAAQBAJ&pg=PA205&lpg=PA205#

#pragma once

#include <assertUtils.hpp>

#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace cloak::util {

// A fixed-size thread pool that runs any callable and hands the result back through a std::future.
class ThreadPool {
 public:
  // Starts thread_count > 0 threads. Each thread tags its log lines with "<name>-<index>".
  ThreadPool(unsigned int thread_count, const std::string& name = "pool") : name_{name} {
    CloakAssertGT(thread_count, 0u);
    for (auto i = 0u; i < thread_count; ++i) {
      threads_.emplace_back([this, i]() {
        MDC_PUT(MDC_THREAD_KEY, name_ + "-" + std::to_string(i));
        loop();
      });
    }
  }

  ThreadPool() : ThreadPool{std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1} {}

  // Stops the pool. Tasks already running are waited for, queued tasks are dropped and their futures report
  // std::future_error (broken_promise).
  ~ThreadPool() noexcept {
    {
      auto lock = std::lock_guard{task_queue_.mutex};
      task_queue_.stop = true;
    }
    task_queue_.cv.notify_all();
    for (auto& t : threads_) {
      t.join();
    }
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Runs func(args...) on a pool thread. Arguments are copied or moved; use std::ref() to pass references.
  // Unlike std::async, destroying the returned future without waiting does not block.
  template <class F, class... Args>
  auto async(F&& func, Args&&... args) {
    using ResultType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;
    auto ptask = std::packaged_task<ResultType(std::decay_t<Args>...)>{std::forward<F>(func)};
    auto future = ptask.get_future();
    auto task = GenericTask{[ptask = std::move(ptask), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable {
      std::apply(ptask, std::move(tup));
    }};
    {
      auto lock = std::lock_guard{task_queue_.mutex};
      task_queue_.tasks.push(std::move(task));
    }
    task_queue_.cv.notify_one();
    return future;
  }

  // Number of tasks waiting for a free thread.
  size_t queued() const {
    auto lock = std::lock_guard{task_queue_.mutex};
    return task_queue_.tasks.size();
  }

  size_t size() const { return threads_.size(); }

 private:
  using GenericTask = std::packaged_task<void()>;

  void loop() noexcept {
    while (true) {
      auto lock = std::unique_lock{task_queue_.mutex};
      task_queue_.cv.wait(lock, [this]() { return !task_queue_.tasks.empty() || task_queue_.stop; });
      if (task_queue_.stop) break;
      auto task = std::move(task_queue_.tasks.front());
      task_queue_.tasks.pop();
      lock.unlock();
      // Exceptions thrown by the callable are stored in its future by packaged_task.
      task();
    }
  }

  struct TaskQueue {
    std::queue<GenericTask> tasks;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stop{false};
  };

  const std::string name_;
  TaskQueue task_queue_;
  std::vector<std::thread> threads_;
};

}  // namespace cloak::util
