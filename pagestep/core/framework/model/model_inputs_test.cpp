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

#include "model_inputs.h"

#include <gtest/gtest.h>
#include <torch/torch.h>

namespace pagestep {

namespace {

ModelInputs make_prefill_inputs(int64_t seq_len,
                                int64_t history_length,
                                int64_t n_blocks) {
  ModelInputs inputs;
  inputs.input_ids = torch::arange(seq_len, torch::kLong).view({1, seq_len});
  inputs.seq_length = torch::tensor({seq_len}, torch::kLong);
  inputs.history_lengths = torch::tensor({history_length}, torch::kLong);
  inputs.block_offsets = torch::arange(n_blocks, torch::kLong).view({1, -1});
  inputs.max_q_seq_length = seq_len;
  inputs.max_history_length = history_length;
  inputs.is_decoding = false;
  inputs.num_ignored_history = torch::zeros({1}, torch::kLong);
  return inputs;
}

ModelInputs make_decode_inputs() {
  ModelInputs inputs;
  inputs.input_ids = torch::tensor({11, 12}, torch::kLong).view({2, 1});
  inputs.seq_length = torch::ones({2}, torch::kLong);
  inputs.history_lengths = torch::tensor({3, 5}, torch::kLong);
  inputs.block_offsets = torch::tensor({0, 1, 2, 3}, torch::kLong).view({2, 2});
  inputs.max_q_seq_length = 1;
  inputs.max_history_length = 5;
  inputs.is_decoding = true;
  inputs.num_ignored_history = torch::zeros({2}, torch::kLong);
  return inputs;
}

}  // namespace

TEST(ModelInputsTest, UpdateDecoding) {
  ModelInputs inputs = make_decode_inputs();
  const torch::Tensor old_history = inputs.history_lengths;

  ModelInputs& updated = inputs.update(torch::tensor({21, 22}, torch::kLong));
  EXPECT_EQ(&updated, &inputs);
  EXPECT_TRUE(torch::equal(inputs.input_ids,
                           torch::tensor({21, 22}, torch::kLong).view({2, 1})));
  EXPECT_TRUE(
      torch::equal(inputs.history_lengths, torch::tensor({4, 6}, torch::kLong)));
  EXPECT_EQ(inputs.max_history_length, 6);
  // the previous history tensor is left untouched
  EXPECT_TRUE(torch::equal(old_history, torch::tensor({3, 5}, torch::kLong)));
}

TEST(ModelInputsTest, UpdateNormalizesRowVector) {
  ModelInputs inputs = make_decode_inputs();
  inputs.update(torch::tensor({31, 32}, torch::kLong).view({1, 2}))
      .update(torch::tensor({41, 42}, torch::kLong).view({1, 2}));
  EXPECT_EQ(inputs.input_ids.size(0), 2);
  EXPECT_EQ(inputs.input_ids.size(1), 1);
  EXPECT_TRUE(torch::equal(inputs.input_ids,
                           torch::tensor({41, 42}, torch::kLong).view({2, 1})));
  EXPECT_TRUE(
      torch::equal(inputs.history_lengths, torch::tensor({5, 7}, torch::kLong)));
  EXPECT_EQ(inputs.max_history_length, 7);
}

TEST(ModelInputsTest, UpdatePrefillFails) {
  ModelInputs inputs = make_prefill_inputs(8, 0, 1);
  EXPECT_DEATH(inputs.update(torch::tensor({1}, torch::kLong)),
               "only allowed on decoding inputs");
}

TEST(ModelInputsTest, SplitShortSequence) {
  const ModelInputs inputs = make_prefill_inputs(16, 0, 2);
  const std::vector<ModelInputs> chunks =
      inputs.split(/*split_size=*/16, /*block_size=*/8);
  ASSERT_EQ(chunks.size(), 1);
  EXPECT_TRUE(chunks[0].input_ids.is_same(inputs.input_ids));
  EXPECT_TRUE(chunks[0].history_lengths.is_same(inputs.history_lengths));
  EXPECT_EQ(chunks[0].max_q_seq_length, 16);
}

TEST(ModelInputsTest, SplitCoversSequence) {
  const ModelInputs inputs = make_prefill_inputs(40, 0, 5);
  const std::vector<ModelInputs> chunks =
      inputs.split(/*split_size=*/16, /*block_size=*/8);
  ASSERT_EQ(chunks.size(), 3);

  const std::vector<int64_t> expected_lens = {16, 16, 8};
  int64_t history = 0;
  std::vector<torch::Tensor> ids;
  for (size_t i = 0; i < chunks.size(); ++i) {
    const ModelInputs& chunk = chunks[i];
    EXPECT_EQ(chunk.num_sequences(), 1);
    EXPECT_EQ(chunk.seq_length[0].item<int64_t>(), expected_lens[i]);
    EXPECT_EQ(chunk.max_q_seq_length, expected_lens[i]);
    EXPECT_EQ(chunk.history_lengths[0].item<int64_t>(), history);
    EXPECT_EQ(chunk.max_history_length, history);
    EXPECT_FALSE(chunk.is_decoding);
    // every chunk sees the whole block table
    EXPECT_TRUE(chunk.block_offsets.is_same(inputs.block_offsets));
    ids.push_back(chunk.input_ids);
    history += expected_lens[i];
  }
  EXPECT_TRUE(torch::equal(torch::cat(ids, 1), inputs.input_ids));
}

TEST(ModelInputsTest, SplitWithUnalignedHistory) {
  // 4 history tokens + 20 new tokens need 6 blocks of size 4
  ModelInputs inputs = make_prefill_inputs(20, 4, 6);
  inputs.max_history_length = 4;
  inputs.adapter_info = AdapterInfo();
  const std::vector<ModelInputs> chunks =
      inputs.split(/*split_size=*/8, /*block_size=*/4);
  ASSERT_EQ(chunks.size(), 3);
  EXPECT_EQ(chunks[0].history_lengths[0].item<int64_t>(), 4);
  EXPECT_EQ(chunks[1].history_lengths[0].item<int64_t>(), 12);
  EXPECT_EQ(chunks[2].history_lengths[0].item<int64_t>(), 20);
  EXPECT_EQ(chunks[2].max_history_length, 20);
  EXPECT_EQ(chunks[2].seq_length[0].item<int64_t>(), 4);
  for (const auto& chunk : chunks) {
    EXPECT_TRUE(chunk.adapter_info.has_value());
  }
}

TEST(ModelInputsTest, SplitSlidingWindow) {
  // 8 of the 8 history tokens slid out of the window, so the 16 new tokens
  // fit in a block table of 4 blocks
  ModelInputs inputs = make_prefill_inputs(16, 8, 4);
  inputs.num_ignored_history = torch::tensor({8}, torch::kLong);
  const std::vector<ModelInputs> chunks =
      inputs.split(/*split_size=*/8, /*block_size=*/4);
  ASSERT_EQ(chunks.size(), 2);
  EXPECT_EQ(chunks[0].history_lengths[0].item<int64_t>(), 8);
  EXPECT_EQ(chunks[1].history_lengths[0].item<int64_t>(), 16);
  for (const auto& chunk : chunks) {
    EXPECT_EQ(chunk.seq_length[0].item<int64_t>(), 8);
    EXPECT_EQ(chunk.num_ignored_history[0].item<int64_t>(), 8);
    EXPECT_EQ(chunk.block_offsets.size(1), 4);
  }
}

TEST(ModelInputsTest, SplitSlidingWindowBlockTableTooSmall) {
  ModelInputs inputs = make_prefill_inputs(16, 8, 3);
  inputs.num_ignored_history = torch::tensor({4}, torch::kLong);
  EXPECT_DEATH(inputs.split(/*split_size=*/8, /*block_size=*/4),
               "can not hold chunk");
}

TEST(ModelInputsTest, SplitBatchedInputFails) {
  ModelInputs inputs = make_decode_inputs();
  EXPECT_DEATH(inputs.split(16, 8), "Can not perform split on batched input");
}

TEST(ModelInputsTest, SplitSizeNotMultipleOfBlockSize) {
  const ModelInputs inputs = make_prefill_inputs(40, 0, 5);
  EXPECT_DEATH(inputs.split(/*split_size=*/12, /*block_size=*/8),
               "should be multi of block_size");
}

TEST(ModelInputsTest, SplitBlockTableTooSmall) {
  const ModelInputs inputs = make_prefill_inputs(40, 0, 3);
  EXPECT_DEATH(inputs.split(/*split_size=*/16, /*block_size=*/8),
               "can not hold chunk");
}

TEST(ModelInputsTest, ToDevice) {
  ModelInputs inputs = make_decode_inputs();
  inputs.local_adapter_ids = torch::tensor({0, 1}, torch::kLong);

  const ModelInputs moved = inputs.to(torch::Device(torch::kCPU));
  EXPECT_TRUE(torch::equal(moved.input_ids, inputs.input_ids));
  EXPECT_TRUE(torch::equal(moved.block_offsets, inputs.block_offsets));
  EXPECT_TRUE(torch::equal(moved.local_adapter_ids, inputs.local_adapter_ids));
  EXPECT_EQ(moved.max_history_length, inputs.max_history_length);
  EXPECT_TRUE(moved.is_decoding);
  EXPECT_FALSE(moved.adapter_info.has_value());
  EXPECT_FALSE(moved.vision_inputs.has_value());
}

}  // namespace pagestep
