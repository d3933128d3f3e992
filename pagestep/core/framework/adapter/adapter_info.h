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

#include <torch/torch.h>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scheduler_adapter.h"

namespace pagestep {

// Packed low-rank adapter parameters of the adapters active in one step.
struct AdapterInfo {
  // stack the parameters of the given adapters, returns std::nullopt when
  // no adapter is active.
  static std::optional<AdapterInfo> from_adapters(
      const std::vector<SchedulerAdapter>& adapters);

  // split into one single-target AdapterInfo per target module, keyed by
  // module name. kernels apply one target module at a time.
  std::unordered_map<std::string, AdapterInfo> split_by_targets() const;

  AdapterInfo to(const torch::Device& device) const;

  int64_t num_adapters() const { return ranks.defined() ? ranks.size(0) : 0; }

  // LongTensor: [num_adapters, num_targets], [num_adapters] after split
  torch::Tensor ranks;

  // FloatTensor: [num_adapters, num_targets], [num_adapters] after split
  torch::Tensor scalings;

  // LongTensor: [num_adapters, num_targets * max_rank]
  torch::Tensor rank_offsets;

  std::vector<std::string> target_modules;

  // max rank over adapters for each target module
  std::vector<int64_t> max_rank_per_target;

  int64_t max_rank = 0;
};

}  // namespace pagestep
