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

#include <utility>
#include <vector>

namespace pagestep {

// Vision embeddings produced upstream for the sequences of a batch, indexed
// by absolute token offsets into each sequence (history + current tokens).
struct VisionModelInputs {
  // select the embedding rows falling into the tokens of the current step,
  // [history_lengths[i], history_lengths[i] + seq_lengths[i]) for slot i.
  // returns the concatenated embeddings and, for each embedding row, its
  // position in the packed token stream of the step. both are undefined
  // when no embedding overlaps the step.
  std::pair<torch::Tensor, torch::Tensor> get_inputs(
      const torch::Tensor& history_lengths,
      const torch::Tensor& seq_lengths) const;

  VisionModelInputs to(const torch::Device& device) const;

  bool has_embeddings() const { return !input_embeddings.empty(); }

  // LongTensor: [n_seq], the history length each slot had when the
  // embedding positions were recorded
  torch::Tensor history_lengths;

  // LongTensor: [n_seq]
  torch::Tensor history_image_nums;

  // LongTensor: [n_seq]
  torch::Tensor history_image_token_lengths;

  // embeddings of each slot, each [n_tokens, hidden_size]
  std::vector<std::vector<torch::Tensor>> input_embeddings;

  // LongTensor: [n_embeddings, 2] per slot, the [start, end) token range of
  // each embedding in input_embeddings
  std::vector<torch::Tensor> input_embedding_ranges;

  // BoolTensor per slot, true at the positions taken by vision embeddings.
  // position 0 of the mask is token history_lengths[i] of the slot.
  std::vector<torch::Tensor> input_embedding_indexing;
};

}  // namespace pagestep
