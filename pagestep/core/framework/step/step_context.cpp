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

#include "step_context.h"

#include <glog/logging.h>

#include <tuple>

#include "step_context_backend.h"
#include "util/tensor_helper.h"

namespace pagestep {

StepContext StepContext::build(const ModelInputs& inputs,
                               int32_t world_size,
                               std::vector<KVCache> kv_caches,
                               const CacheConfig& cache_config,
                               const StepContextBackend* backend) {
  const torch::Tensor& q_seq_length = inputs.seq_length;
  const torch::Tensor& history_lengths = inputs.history_lengths;
  const int64_t max_q_seq_length = inputs.max_q_seq_length;
  const int64_t batch_size = inputs.num_sequences();
  const auto options =
      torch::TensorOptions().dtype(torch::kLong).device(q_seq_length.device());

  StepContext ctx;

  // for vlm
  if (inputs.vision_inputs.has_value() &&
      inputs.vision_inputs->has_embeddings()) {
    std::tie(ctx.input_embeddings, ctx.input_embedding_indexing) =
        inputs.vision_inputs->get_inputs(history_lengths, q_seq_length);
  }

  torch::Tensor position_ids;
  if (inputs.is_decoding) {
    CHECK_EQ(max_q_seq_length, 1)
        << "decoding inputs should have one token per sequence";
    ctx.q_start_loc = torch::arange(batch_size, options);
    ctx.attention_mask = torch::ones_like(q_seq_length).unsqueeze(1);
    position_ids = history_lengths.unsqueeze(-1);
  } else {
    ctx.q_start_loc = q_seq_length.cumsum(/*dim=*/0) - q_seq_length;
    const auto mask_range =
        torch::arange(max_q_seq_length, options).unsqueeze(0);
    ctx.attention_mask =
        (mask_range < q_seq_length.unsqueeze(1)).to(torch::kLong);
    // positions only count valid tokens, starting after the history
    position_ids = ctx.attention_mask.cumsum(/*dim=*/-1) - 1 +
                   history_lengths.unsqueeze(-1);
  }
  ctx.position_ids = get_position_ids_1d(position_ids, q_seq_length);

  // seq_len + history_length
  ctx.kv_seq_length = q_seq_length + history_lengths;
  ctx.max_kv_seq_length = max_q_seq_length + inputs.max_history_length;
  if (cache_config.window_size() > 0) {
    ctx.kv_seq_length = ctx.kv_seq_length - inputs.num_ignored_history;
  }

  if (inputs.adapter_info.has_value()) {
    ctx.adapter_params = inputs.adapter_info->split_by_targets();
  }

  ctx.inputs = inputs;
  ctx.block_offsets = inputs.block_offsets;
  ctx.history_lengths = history_lengths;
  ctx.q_seq_length = q_seq_length;
  ctx.max_q_seq_length = max_q_seq_length;
  ctx.kv_caches = std::move(kv_caches);
  ctx.is_decoding = inputs.is_decoding;
  ctx.world_size = world_size;
  ctx.block_size = cache_config.block_size();
  ctx.local_adapter_ids = inputs.local_adapter_ids;

  VLOG(1) << "built step context: num_sequences=" << batch_size
          << ", is_decoding=" << ctx.is_decoding
          << ", num_tokens=" << ctx.position_ids.numel()
          << ", max_kv_seq_length=" << ctx.max_kv_seq_length;

  const StepContextBackend& step_backend =
      backend != nullptr ? *backend : get_backend();
  return step_backend.update_step_context(std::move(ctx));
}

torch::Tensor StepContext::get_position_ids_1d(
    const torch::Tensor& position_ids,
    const torch::Tensor& seq_length) {
  if (position_ids.size(0) == 1 || position_ids.size(1) == 1) {
    return position_ids.flatten();
  }

  const std::vector<int64_t> seq_lens = to_vector<int64_t>(seq_length);
  CHECK_EQ(static_cast<int64_t>(seq_lens.size()), position_ids.size(0));
  std::vector<torch::Tensor> position_ids_1d;
  position_ids_1d.reserve(seq_lens.size());
  for (size_t i = 0; i < seq_lens.size(); ++i) {
    position_ids_1d.push_back(position_ids[i].slice(0, 0, seq_lens[i]));
  }
  return torch::cat(position_ids_1d, /*dim=*/0);
}

void StepContext::print() const {
  LOG(INFO) << "StepContext: num_sequences is " << num_sequences()
            << " , is_decoding is " << is_decoding
            << " , max_q_seq_length is " << max_q_seq_length
            << " , max_kv_seq_length is " << max_kv_seq_length
            << " , world_size is " << world_size
            << " , num_kv_caches is " << kv_caches.size()
            << " , num_adapter_targets is " << adapter_params.size()
            << " , num_outputs is " << outputs.size();
  if (!kv_caches.empty() && !kv_caches.front().empty()) {
    const KVCache& kv_cache = kv_caches.front();
    LOG(INFO) << "StepContext: k_cache is " << kv_cache.get_k_cache().sizes()
              << " , v_cache is " << kv_cache.get_v_cache().sizes();
  }
  print_tensor(position_ids, "StepContext: position_ids", 8);
  print_tensor(q_start_loc, "StepContext: q_start_loc", 4);
  print_tensor(q_seq_length, "StepContext: q_seq_length", 4);
  print_tensor(kv_seq_length, "StepContext: kv_seq_length", 4);
  print_tensor(input_embedding_indexing,
               "StepContext: input_embedding_indexing",
               4);
}

}  // namespace pagestep
