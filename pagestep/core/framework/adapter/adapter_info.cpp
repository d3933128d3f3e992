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

#include "adapter_info.h"

#include <glog/logging.h>

#include <algorithm>

#include "util/tensor_helper.h"

namespace pagestep {

std::optional<AdapterInfo> AdapterInfo::from_adapters(
    const std::vector<SchedulerAdapter>& adapters) {
  if (adapters.empty()) {
    return std::nullopt;
  }

  // target modules and max rank are shared by all adapters
  const SchedulerAdapter& first = adapters.front();
  const int64_t num_adapters = static_cast<int64_t>(adapters.size());
  const int64_t num_targets = static_cast<int64_t>(first.target_modules.size());
  const int64_t max_rank = first.max_rank;

  std::vector<int64_t> ranks;
  std::vector<float> scalings;
  std::vector<int64_t> rank_offsets;
  ranks.reserve(num_adapters * num_targets);
  scalings.reserve(num_adapters * num_targets);
  rank_offsets.reserve(num_adapters * num_targets * max_rank);
  std::vector<int64_t> max_rank_per_target(num_targets, 0);

  for (size_t i = 0; i < adapters.size(); ++i) {
    const SchedulerAdapter& adapter = adapters[i];
    CHECK(adapter.target_modules == first.target_modules)
        << "adapter " << i << " has different target modules from adapter 0";
    CHECK_EQ(adapter.max_rank, max_rank)
        << "adapter " << i << " has different max_rank from adapter 0";
    CHECK_EQ(static_cast<int64_t>(adapter.rank.size()), num_targets)
        << "adapter " << i << " should have one rank per target module";
    CHECK_EQ(static_cast<int64_t>(adapter.scaling.size()), num_targets)
        << "adapter " << i << " should have one scaling per target module";
    CHECK_EQ(static_cast<int64_t>(adapter.rank_offset.size()),
             num_targets * max_rank)
        << "adapter " << i << " rank_offset should hold max_rank entries "
        << "per target module";

    for (int64_t t = 0; t < num_targets; ++t) {
      max_rank_per_target[t] =
          std::max(max_rank_per_target[t], adapter.rank[t]);
    }
    ranks.insert(ranks.end(), adapter.rank.begin(), adapter.rank.end());
    scalings.insert(
        scalings.end(), adapter.scaling.begin(), adapter.scaling.end());
    rank_offsets.insert(rank_offsets.end(),
                        adapter.rank_offset.begin(),
                        adapter.rank_offset.end());
  }

  AdapterInfo info;
  info.ranks =
      torch::tensor(ranks, torch::kLong).view({num_adapters, num_targets});
  info.scalings =
      torch::tensor(scalings, torch::kFloat).view({num_adapters, num_targets});
  info.rank_offsets = torch::tensor(rank_offsets, torch::kLong)
                          .view({num_adapters, num_targets * max_rank});
  info.target_modules = first.target_modules;
  info.max_rank_per_target = std::move(max_rank_per_target);
  info.max_rank = max_rank;
  return info;
}

std::unordered_map<std::string, AdapterInfo> AdapterInfo::split_by_targets()
    const {
  CHECK_EQ(ranks.dim(), 2) << "AdapterInfo is already split by targets";

  std::unordered_map<std::string, AdapterInfo> ret;
  ret.reserve(target_modules.size());
  for (size_t idx = 0; idx < target_modules.size(); ++idx) {
    const std::string& target = target_modules[idx];
    const int64_t r_off_start = static_cast<int64_t>(idx) * max_rank;
    const int64_t r_off_end = r_off_start + max_rank;

    AdapterInfo info;
    info.ranks = ranks.select(/*dim=*/1, idx).clone();
    info.scalings = scalings.select(/*dim=*/1, idx).clone();
    info.rank_offsets = rank_offsets.slice(1, r_off_start, r_off_end).clone();
    info.target_modules = {target};
    info.max_rank_per_target = {max_rank_per_target[idx]};
    info.max_rank = max_rank_per_target[idx];
    ret.emplace(target, std::move(info));
  }
  return ret;
}

AdapterInfo AdapterInfo::to(const torch::Device& device) const {
  AdapterInfo info;
  info.ranks = safe_to(ranks, device, true);
  info.scalings = safe_to(scalings, device, true);
  info.rank_offsets = safe_to(rank_offsets, device, true);
  info.target_modules = target_modules;
  info.max_rank_per_target = max_rank_per_target;
  info.max_rank = max_rank;
  return info;
}

}  // namespace pagestep
