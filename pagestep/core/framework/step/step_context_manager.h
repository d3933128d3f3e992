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

#include <utility>
#include <vector>

#include "common/macros.h"
#include "step_context.h"
#include "util/scope_guard.h"

namespace pagestep {

// Holds the context of the step being executed on one compute stream.
// Pass the StepContext down explicitly where possible, the manager serves
// the nested code that can not get it otherwise. Only one context can be
// installed at a time.
class StepContextManager final {
 public:
  // Installs a context for the lifetime of this object.
  class ScopedContext final {
   public:
    ScopedContext(StepContextManager* manager, const StepContext& ctx);
    ~ScopedContext();

    const StepContext& get() const { return *ctx_; }

    DISALLOW_COPY_AND_ASSIGN(ScopedContext);

   private:
    StepContextManager* manager_ = nullptr;
    const StepContext* ctx_ = nullptr;
  };

  StepContextManager() = default;

  // backend used by build_context, nullptr means the process-wide one.
  explicit StepContextManager(const StepContextBackend* backend)
      : backend_(backend) {}

  DISALLOW_COPY_AND_ASSIGN(StepContextManager);

  // manager of the calling thread
  static StepContextManager& get_instance();

  StepContext build_context(
      const ModelInputs& inputs,
      int32_t world_size = 1,
      std::vector<KVCache> kv_caches = {},
      const CacheConfig& cache_config = CacheConfig()) const;

  // install ctx as the current context until the returned scope is
  // destroyed. ctx must outlive the scope.
  [[nodiscard]] ScopedContext context(const StepContext& ctx) {
    return ScopedContext(this, ctx);
  }

  // run fn(ctx) with ctx installed as the current context.
  template <typename Fn>
  decltype(auto) with_context(const StepContext& ctx, Fn&& fn) {
    install(ctx);
    SCOPE_GUARD([this] { clear(); });
    return std::forward<Fn>(fn)(ctx);
  }

  // returns nullptr when no step is running
  const StepContext* current_context() const { return current_ctx_; }

 private:
  void install(const StepContext& ctx);
  void clear() noexcept { current_ctx_ = nullptr; }

  const StepContextBackend* backend_ = nullptr;
  const StepContext* current_ctx_ = nullptr;
};

}  // namespace pagestep
