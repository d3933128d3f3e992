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

#include "step_context_manager.h"

#include <glog/logging.h>

namespace pagestep {

StepContextManager::ScopedContext::ScopedContext(StepContextManager* manager,
                                                 const StepContext& ctx)
    : manager_(manager), ctx_(&ctx) {
  manager_->install(ctx);
}

StepContextManager::ScopedContext::~ScopedContext() { manager_->clear(); }

StepContextManager& StepContextManager::get_instance() {
  thread_local StepContextManager manager;
  return manager;
}

StepContext StepContextManager::build_context(
    const ModelInputs& inputs,
    int32_t world_size,
    std::vector<KVCache> kv_caches,
    const CacheConfig& cache_config) const {
  return StepContext::build(
      inputs, world_size, std::move(kv_caches), cache_config, backend_);
}

void StepContextManager::install(const StepContext& ctx) {
  CHECK(current_ctx_ == nullptr)
      << "a step context is already installed, nested steps are not allowed";
  current_ctx_ = &ctx;
}

}  // namespace pagestep
