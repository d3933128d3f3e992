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

#include <glog/logging.h>

#include <algorithm>

#include "util/tensor_helper.h"

namespace pagestep {

ModelInputs& ModelInputs::update(const torch::Tensor& new_input_ids) {
  CHECK(is_decoding) << "update is only allowed on decoding inputs";

  const int64_t n_seq = num_sequences();
  torch::Tensor ids = new_input_ids;
  if (ids.dim() == 1) {
    ids = ids.unsqueeze(-1);
  } else if (ids.size(0) == 1 && ids.size(1) == n_seq) {
    // [1, n_seq] -> [n_seq, 1]
    ids = ids.reshape({n_seq, 1});
  }
  CHECK_EQ(ids.dim(), 2);
  CHECK_EQ(ids.size(0), n_seq) << "expect one new token per sequence";
  CHECK_EQ(ids.size(1), 1) << "expect one new token per sequence";

  history_lengths = history_lengths + 1;
  max_history_length += 1;
  input_ids = ids;
  return *this;
}

std::vector<ModelInputs> ModelInputs::split(int64_t split_size,
                                            int64_t block_size) const {
  CHECK_EQ(num_sequences(), 1) << "Can not perform split on batched input.";
  CHECK_GT(block_size, 0);
  CHECK(split_size > 0 && split_size % block_size == 0)
      << "split_size " << split_size << " should be multi of block_size "
      << block_size;

  const int64_t max_seq_len = seq_length[0].item<int64_t>();
  if (max_seq_len <= split_size) {
    return {*this};
  }

  CHECK(block_offsets.defined()) << "block_offsets is required to split";
  const int64_t history_length = history_lengths[0].item<int64_t>();
  // tokens that slid out of the window no longer own blocks, the block
  // table starts at the first token inside the window
  const int64_t num_ignored =
      num_ignored_history.defined() ? num_ignored_history[0].item<int64_t>()
                                    : 0;
  CHECK_GE(history_length, num_ignored);
  const int64_t visible_history = history_length - num_ignored;
  const int64_t n_blocks_allocated = block_offsets.size(-1);
  const int64_t first_block = visible_history / block_size;
  const int64_t num_blocks = split_size / block_size;
  // the partial block at the end of the history is shared with the first
  // chunk, so every chunk may touch one more block
  const bool overlap = visible_history % block_size != 0;

  std::vector<ModelInputs> ret;
  ret.reserve((max_seq_len + split_size - 1) / split_size);
  int64_t block_start = 0;
  for (int64_t start = 0; start < max_seq_len; start += split_size) {
    const int64_t end = std::min(max_seq_len, start + split_size);
    int64_t block_end = block_start + num_blocks;
    if (overlap) {
      ++block_end;
    }

    const int64_t n_blocks_needed =
        (visible_history + end + block_size - 1) / block_size;
    CHECK_LE(n_blocks_needed, n_blocks_allocated)
        << "block table with " << n_blocks_allocated
        << " blocks can not hold chunk [" << start << ", " << end
        << ") after " << visible_history << " visible history tokens";
    VLOG(2) << "prefill chunk [" << start << ", " << end << ") uses blocks ["
            << first_block + block_start << ", "
            << std::min(first_block + block_end, n_blocks_allocated) << ")";

    ModelInputs inp;
    inp.input_ids = input_ids.slice(/*dim=*/1, start, end);
    inp.seq_length = torch::full({1}, end - start, seq_length.options());
    // history blocks are addressed from the start of the block table
    inp.block_offsets = block_offsets;
    inp.history_lengths = history_lengths + start;
    inp.max_q_seq_length = end - start;
    inp.max_history_length = max_history_length + start;
    inp.is_decoding = is_decoding;
    inp.num_ignored_history = num_ignored_history;
    inp.local_adapter_ids = local_adapter_ids;
    inp.adapter_info = adapter_info;
    inp.vision_inputs = vision_inputs;
    inp.meta = meta;
    ret.push_back(std::move(inp));

    block_start += num_blocks;
  }
  return ret;
}

ModelInputs ModelInputs::to(const torch::Device& device) const {
  ModelInputs inputs;
  inputs.input_ids = safe_to(input_ids, device, true);
  inputs.seq_length = safe_to(seq_length, device, true);
  inputs.history_lengths = safe_to(history_lengths, device, true);
  inputs.block_offsets = safe_to(block_offsets, device, true);
  inputs.max_q_seq_length = max_q_seq_length;
  inputs.max_history_length = max_history_length;
  inputs.is_decoding = is_decoding;
  inputs.num_ignored_history = safe_to(num_ignored_history, device, true);
  inputs.local_adapter_ids = safe_to(local_adapter_ids, device, true);
  if (adapter_info.has_value()) {
    inputs.adapter_info = adapter_info->to(device);
  }
  if (vision_inputs.has_value()) {
    inputs.vision_inputs = vision_inputs->to(device);
  }
  inputs.meta = meta;
  return inputs;
}

void ModelInputs::print() const {
  LOG(INFO) << "ModelInputs: num_sequences is " << num_sequences()
            << " , max_q_seq_length is " << max_q_seq_length
            << " , max_history_length is " << max_history_length
            << " , is_decoding is " << is_decoding
            << " , has adapters is " << adapter_info.has_value()
            << " , has vision inputs is " << vision_inputs.has_value();
  print_tensor(input_ids, "ModelInputs: input_ids", 4);
  print_tensor(seq_length, "ModelInputs: seq_length", 4);
  print_tensor(history_lengths, "ModelInputs: history_lengths", 4);
  print_tensor(block_offsets, "ModelInputs: block_offsets", 4);
}

}  // namespace pagestep
