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

#include <type_traits>
#include <utility>

namespace voile::util {

// Calls the stored function when the enclosing scope is left, by return or by exception.
template <typename EF>
class ScopeExit {
 public:
  template <typename Fn, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Fn>, ScopeExit>>>
  explicit ScopeExit(Fn&& fn) noexcept : fn_{std::forward<Fn>(fn)} {}

  ~ScopeExit() noexcept { fn_(); }

  ScopeExit(const ScopeExit&) = delete;
  ScopeExit& operator=(const ScopeExit&) = delete;

 private:
  EF fn_;
};

template <typename EF>
ScopeExit(EF) -> ScopeExit<EF>;

}  // namespace voile::util
