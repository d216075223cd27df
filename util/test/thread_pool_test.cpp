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

#include "gtest/gtest.h"

#include "thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace voile::util;
using namespace std::chrono_literals;

using testing::InitGoogleTest;

constexpr auto answer = 42;

struct MoveOnly {
  MoveOnly() = default;
  MoveOnly(const MoveOnly&) = delete;
  MoveOnly(MoveOnly&&) = default;
  MoveOnly& operator=(const MoveOnly&) = delete;
  MoveOnly& operator=(MoveOnly&&) = default;
};

void own(MoveOnly&&) {}

TEST(thread_pool, lambda) {
  auto pool = ThreadPool{1};
  auto future = pool.async([]() { return answer; });
  ASSERT_EQ(answer, future.get());
}

TEST(thread_pool, arguments_with_return) {
  auto pool = ThreadPool{2};
  auto future = pool.async([](int v, const std::string& s) { return s + std::to_string(v); }, answer, "n");
  ASSERT_EQ("n42", future.get());
}

TEST(thread_pool, move_only_arguments) {
  auto pool = ThreadPool{1};
  auto future = pool.async(own, MoveOnly{});
  ASSERT_NO_THROW(future.wait());
}

TEST(thread_pool, exceptions_reach_the_future) {
  auto pool = ThreadPool{1};
  auto future = pool.async([]() -> int { throw std::runtime_error{"boom"}; });
  ASSERT_THROW(future.get(), std::runtime_error);
  // The worker survives and keeps serving tasks.
  ASSERT_EQ(answer, pool.async([]() { return answer; }).get());
}

TEST(thread_pool, wait_for_times_out_on_a_slow_task) {
  auto pool = ThreadPool{1};
  auto release = std::promise<void>{};
  auto gate = release.get_future().share();
  auto future = pool.async([gate]() {
    gate.wait();
    return answer;
  });
  ASSERT_EQ(std::future_status::timeout, future.wait_for(20ms));
  release.set_value();
  ASSERT_EQ(answer, future.get());
}

TEST(thread_pool, many_tasks_on_many_threads) {
  auto pool = ThreadPool{4};
  auto counter = std::atomic_int{0};
  auto futures = std::vector<std::future<void>>{};
  for (auto i = 0; i < 1000; ++i) {
    futures.push_back(pool.async([&counter]() { ++counter; }));
  }
  for (auto& f : futures) f.wait();
  ASSERT_EQ(1000, counter);
}

}  // namespace

int main(int argc, char* argv[]) {
  InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
