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

#include <memory>
#include <optional>
#include <vector>

#include "framework/adapter/adapter_info.h"
#include "framework/vision/vision_model_inputs.h"

namespace pagestep {

// Raw inputs of one model step as produced by the scheduler.
struct ModelInputs {
  // advance a decoding batch by one token: every slot gains one history
  // token and input_ids becomes the new tokens, [n_seq, 1].
  ModelInputs& update(const torch::Tensor& new_input_ids);

  // split a single-sequence prefill into chunks of at most split_size
  // tokens. split_size should be a multiple of block_size.
  std::vector<ModelInputs> split(int64_t split_size, int64_t block_size) const;

  ModelInputs to(const torch::Device& device) const;

  void print() const;

  int64_t num_sequences() const {
    return seq_length.defined() ? seq_length.size(0) : 0;
  }

  // LongTensor: [n_seq, max_q_seq_length], right padded
  torch::Tensor input_ids;

  // LongTensor: [n_seq], number of new tokens of each slot
  torch::Tensor seq_length;

  // LongTensor: [n_seq], number of tokens already in the kv cache
  torch::Tensor history_lengths;

  // LongTensor: [n_seq, max_n_blocks]
  torch::Tensor block_offsets;

  int64_t max_q_seq_length = 0;
  int64_t max_history_length = 0;

  // whether all slots decode a single token
  bool is_decoding = false;

  // LongTensor: [n_seq], history tokens out of the sliding window
  torch::Tensor num_ignored_history;

  // LongTensor: [n_seq], adapter of each slot
  torch::Tensor local_adapter_ids;

  std::optional<AdapterInfo> adapter_info;

  std::optional<VisionModelInputs> vision_inputs;

  // scheduler bookkeeping, passed through untouched
  std::shared_ptr<const void> meta;
};

}  // namespace pagestep
