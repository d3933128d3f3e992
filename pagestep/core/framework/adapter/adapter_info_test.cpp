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

#include <gtest/gtest.h>
#include <torch/torch.h>

namespace pagestep {

namespace {

// two target modules, max_rank 4
std::vector<SchedulerAdapter> make_adapters() {
  SchedulerAdapter a;
  a.target_modules = {"q_proj", "v_proj"};
  a.max_rank = 4;
  a.rank = {2, 4};
  a.scaling = {0.5f, 1.0f};
  a.rank_offset = {0, 1, 0, 0, /*v_proj*/ 2, 3, 4, 5};

  SchedulerAdapter b;
  b.target_modules = {"q_proj", "v_proj"};
  b.max_rank = 4;
  b.rank = {3, 1};
  b.scaling = {2.0f, 0.25f};
  b.rank_offset = {6, 7, 8, 0, /*v_proj*/ 9, 0, 0, 0};
  return {a, b};
}

}  // namespace

TEST(AdapterInfoTest, EmptyAdapters) {
  EXPECT_FALSE(AdapterInfo::from_adapters({}).has_value());
}

TEST(AdapterInfoTest, FromAdapters) {
  const auto info = AdapterInfo::from_adapters(make_adapters());
  ASSERT_TRUE(info.has_value());

  EXPECT_EQ(info->num_adapters(), 2);
  EXPECT_TRUE(torch::equal(info->ranks,
                           torch::tensor({2, 4, 3, 1}, torch::kLong)
                               .view({2, 2})));
  EXPECT_TRUE(torch::equal(
      info->scalings,
      torch::tensor({0.5f, 1.0f, 2.0f, 0.25f}, torch::kFloat).view({2, 2})));
  EXPECT_EQ(info->rank_offsets.size(0), 2);
  EXPECT_EQ(info->rank_offsets.size(1), 8);
  EXPECT_EQ(info->target_modules,
            std::vector<std::string>({"q_proj", "v_proj"}));
  EXPECT_EQ(info->max_rank, 4);
  EXPECT_EQ(info->max_rank_per_target, std::vector<int64_t>({3, 4}));
}

TEST(AdapterInfoTest, SplitByTargets) {
  const auto info = AdapterInfo::from_adapters(make_adapters());
  ASSERT_TRUE(info.has_value());

  const auto split = info->split_by_targets();
  ASSERT_EQ(split.size(), 2);

  const AdapterInfo& q_proj = split.at("q_proj");
  EXPECT_TRUE(torch::equal(q_proj.ranks, torch::tensor({2, 3}, torch::kLong)));
  EXPECT_TRUE(torch::equal(q_proj.scalings,
                           torch::tensor({0.5f, 2.0f}, torch::kFloat)));
  EXPECT_TRUE(torch::equal(
      q_proj.rank_offsets,
      torch::tensor({0, 1, 0, 0, 6, 7, 8, 0}, torch::kLong).view({2, 4})));
  EXPECT_EQ(q_proj.target_modules, std::vector<std::string>({"q_proj"}));
  EXPECT_EQ(q_proj.max_rank, 3);
  EXPECT_EQ(q_proj.max_rank_per_target, std::vector<int64_t>({3}));

  const AdapterInfo& v_proj = split.at("v_proj");
  EXPECT_TRUE(torch::equal(
      v_proj.rank_offsets,
      torch::tensor({2, 3, 4, 5, 9, 0, 0, 0}, torch::kLong).view({2, 4})));
  EXPECT_EQ(v_proj.max_rank, 4);
}

TEST(AdapterInfoTest, SplitColumnsReassembleOriginal) {
  const auto info = AdapterInfo::from_adapters(make_adapters());
  ASSERT_TRUE(info.has_value());
  const auto split = info->split_by_targets();

  std::vector<torch::Tensor> rank_columns;
  std::vector<torch::Tensor> scaling_columns;
  for (const auto& target : info->target_modules) {
    rank_columns.push_back(split.at(target).ranks);
    scaling_columns.push_back(split.at(target).scalings);
  }
  EXPECT_TRUE(torch::equal(torch::stack(rank_columns, 1), info->ranks));
  EXPECT_TRUE(torch::equal(torch::stack(scaling_columns, 1), info->scalings));
}

TEST(AdapterInfoTest, SplitDoesNotAliasSource) {
  auto info = AdapterInfo::from_adapters(make_adapters());
  ASSERT_TRUE(info.has_value());
  auto split = info->split_by_targets();

  split.at("q_proj").ranks.fill_(0);
  EXPECT_EQ(info->ranks[0][0].item<int64_t>(), 2);
}

TEST(AdapterInfoTest, ToDevice) {
  const auto info = AdapterInfo::from_adapters(make_adapters());
  ASSERT_TRUE(info.has_value());

  const AdapterInfo moved = info->to(torch::Device(torch::kCPU));
  EXPECT_TRUE(torch::equal(moved.ranks, info->ranks));
  EXPECT_TRUE(torch::equal(moved.rank_offsets, info->rank_offsets));
  EXPECT_EQ(moved.target_modules, info->target_modules);
  EXPECT_EQ(moved.max_rank, info->max_rank);
}

TEST(AdapterInfoTest, MismatchedTargetModules) {
  auto adapters = make_adapters();
  adapters[1].target_modules = {"q_proj", "o_proj"};
  EXPECT_DEATH(AdapterInfo::from_adapters(adapters),
               "different target modules");
}

TEST(AdapterInfoTest, MismatchedRankOffsetSize) {
  auto adapters = make_adapters();
  adapters[0].rank_offset.pop_back();
  EXPECT_DEATH(AdapterInfo::from_adapters(adapters), "rank_offset");
}

}  // namespace pagestep
