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

#include "vision_model_inputs.h"

#include <glog/logging.h>

#include <algorithm>

#include "util/tensor_helper.h"

namespace pagestep {

std::pair<torch::Tensor, torch::Tensor> VisionModelInputs::get_inputs(
    const torch::Tensor& history_lengths,
    const torch::Tensor& seq_lengths) const {
  if (input_embeddings.empty()) {
    return {};
  }
  CHECK_EQ(input_embeddings.size(), input_embedding_ranges.size())
      << "each slot should have as many embedding ranges as embedding lists";

  const std::vector<int64_t> his_lens = to_vector<int64_t>(history_lengths);
  const std::vector<int64_t> seq_lens = to_vector<int64_t>(seq_lengths);
  const size_t num_seqs = his_lens.size();
  CHECK_EQ(seq_lens.size(), num_seqs);
  CHECK_EQ(input_embeddings.size(), num_seqs)
      << "vision inputs do not match the batch size";

  std::vector<torch::Tensor> embedding_slices;
  for (size_t i = 0; i < num_seqs; ++i) {
    const auto& embeddings = input_embeddings[i];
    const std::vector<int64_t> ranges =
        to_vector<int64_t>(input_embedding_ranges[i]);
    CHECK_EQ(ranges.size(), embeddings.size() * 2)
        << "slot " << i << " has " << embeddings.size()
        << " embeddings but " << ranges.size() / 2 << " ranges";

    const int64_t window_start = his_lens[i];
    const int64_t window_end = his_lens[i] + seq_lens[i];
    for (size_t j = 0; j < embeddings.size(); ++j) {
      const int64_t emb_start = ranges[2 * j];
      const int64_t emb_end = ranges[2 * j + 1];
      // clip to the window, in the coordinates of the embedding
      const int64_t start = std::max(emb_start, window_start) - emb_start;
      const int64_t end = std::min(emb_end, window_end) - emb_start;
      if (start < end) {
        embedding_slices.push_back(embeddings[j].slice(0, start, end));
      }
    }
  }

  if (embedding_slices.empty()) {
    return {};
  }
  torch::Tensor embeddings = torch::cat(embedding_slices, /*dim=*/0);
  const auto device = embeddings.device();

  const std::vector<int64_t> recorded_his_lens =
      to_vector<int64_t>(this->history_lengths);
  CHECK_EQ(recorded_his_lens.size(), num_seqs);
  CHECK_EQ(input_embedding_indexing.size(), num_seqs);

  std::vector<torch::Tensor> masks;
  masks.reserve(num_seqs);
  for (size_t i = 0; i < num_seqs; ++i) {
    const int64_t start = his_lens[i] - recorded_his_lens[i];
    const int64_t end = start + seq_lens[i];
    CHECK_GE(start, 0) << "slot " << i
                       << " is behind the history of its vision inputs";
    masks.push_back(input_embedding_indexing[i].slice(0, start, end));
    CHECK_EQ(masks.back().size(0), seq_lens[i])
        << "slot " << i << " has an embedding mask of "
        << input_embedding_indexing[i].size(0)
        << " tokens which does not cover the step window [" << start << ", "
        << end << ")";
  }
  const auto mask = torch::cat(masks, /*dim=*/0).to(device).to(torch::kBool);
  const auto index_ranges = torch::arange(
      mask.numel(), torch::TensorOptions().dtype(torch::kLong).device(device));
  torch::Tensor indexing = index_ranges.masked_select(mask);
  CHECK_EQ(indexing.numel(), embeddings.size(0))
      << "vision embedding rows do not match the embedding positions";

  VLOG(2) << "selected " << embeddings.size(0)
          << " vision embedding rows for " << num_seqs << " sequences";
  return {embeddings, indexing};
}

VisionModelInputs VisionModelInputs::to(const torch::Device& device) const {
  VisionModelInputs inputs;
  inputs.history_lengths = safe_to(history_lengths, device, true);
  inputs.history_image_nums = safe_to(history_image_nums, device, true);
  inputs.history_image_token_lengths =
      safe_to(history_image_token_lengths, device, true);

  inputs.input_embeddings.reserve(input_embeddings.size());
  for (const auto& embeddings : input_embeddings) {
    std::vector<torch::Tensor> moved;
    moved.reserve(embeddings.size());
    for (const auto& embedding : embeddings) {
      moved.push_back(safe_to(embedding, device, true));
    }
    inputs.input_embeddings.push_back(std::move(moved));
  }

  inputs.input_embedding_ranges.reserve(input_embedding_ranges.size());
  for (const auto& ranges : input_embedding_ranges) {
    inputs.input_embedding_ranges.push_back(safe_to(ranges, device, true));
  }

  inputs.input_embedding_indexing.reserve(input_embedding_indexing.size());
  for (const auto& indexing : input_embedding_indexing) {
    inputs.input_embedding_indexing.push_back(safe_to(indexing, device, true));
  }
  return inputs;
}

}  // namespace pagestep
