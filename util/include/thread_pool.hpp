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

#include "assertUtils.hpp"

#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace voile::util {

// Runs callables on a fixed set of worker threads and hands back std::future objects for their results.
class ThreadPool {
 public:
  explicit ThreadPool(unsigned int thread_count) noexcept {
    VoileAssert(thread_count > 0);
    for (auto i = 0u; i < thread_count; ++i) {
      threads_.emplace_back([this]() { loop(); });
    }
  }

  // Waits for the task each worker is currently running. Tasks still queued are dropped and
  // their futures report std::future_error(broken_promise).
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

  // Arguments are copied or moved into the task. Use std::ref() to pass references explicitly.
  // The returned future does not block in its destructor.
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
      try {
        task();
      } catch (const std::exception& e) {
        LOG_ERROR(logging::getLogger("voile.util.thread-pool"), e.what());
      }
    }
  }

  struct TaskQueue {
    std::queue<GenericTask> tasks;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop{false};
  };

  TaskQueue task_queue_;
  std::vector<std::thread> threads_;
};

}  // namespace voile::util
