/* Copyright 2026 The PageStep Authors. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#pragma once
#include <type_traits>
#include <utility>

#include "common/macros.h"

namespace pagestep {

// RAII object that invokes a callback on destruction, including when the
// scope is left by an exception.
template <typename Fun>
class ScopeGuard final {
 public:
  template <typename FuncArg>
  ScopeGuard(FuncArg&& f) : callback_(std::forward<FuncArg>(f)) {}

  // disallow copy and move
  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() noexcept {
    if (!dismissed_) {
      callback_();
    }
  }

  void dismiss() noexcept { dismissed_ = true; }

 private:
  Fun callback_;
  bool dismissed_ = false;
};

template <typename Fun>
ScopeGuard(Fun&&) -> ScopeGuard<std::decay_t<Fun>>;

}  // namespace pagestep

// Declares a ScopeGuard object with the given callback.
// Example: SCOPE_GUARD([&]{...});
#define SCOPE_GUARD pagestep::ScopeGuard SAFE_CONCAT(scope_guard, __LINE__)
