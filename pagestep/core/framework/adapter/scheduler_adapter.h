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

#include <cstdint>
#include <string>
#include <vector>

namespace pagestep {

// Adapter parameters as tracked by the scheduler for one active adapter.
// All adapters loaded into one engine share target_modules and max_rank.
struct SchedulerAdapter {
  // rank of the adapter for each target module, [num_targets]
  std::vector<int64_t> rank;

  // scaling of the adapter for each target module, [num_targets]
  std::vector<float> scaling;

  // offsets of the adapter ranks in the shared weight buffer,
  // [num_targets * max_rank]
  std::vector<int64_t> rank_offset;

  std::vector<std::string> target_modules;

  int64_t max_rank = 0;
};

}  // namespace pagestep
