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

#include <string>
#include <unordered_map>
#include <vector>

#include "framework/adapter/adapter_info.h"
#include "framework/config/cache_config.h"
#include "framework/kv_cache/kv_cache.h"
#include "framework/model/model_inputs.h"

namespace pagestep {

class StepContextBackend;

// Metadata of one model step derived from ModelInputs, consumed by the
// attention and compute kernels. Built once per step and not modified after
// the backend has post-processed it.
struct StepContext {
  // derive the step context from the inputs of a step. the backend
  // post-processes the result, the process-wide backend is used when
  // backend is nullptr.
  static StepContext build(const ModelInputs& inputs,
                           int32_t world_size = 1,
                           std::vector<KVCache> kv_caches = {},
                           const CacheConfig& cache_config = CacheConfig(),
                           const StepContextBackend* backend = nullptr);

  // flatten [n_seq, max_q_seq_len] position ids into the packed stream,
  // dropping the padded tail of each row.
  static torch::Tensor get_position_ids_1d(const torch::Tensor& position_ids,
                                           const torch::Tensor& seq_length);

  void print() const;

  int64_t num_sequences() const {
    return q_seq_length.defined() ? q_seq_length.size(0) : 0;
  }

  ModelInputs inputs;

  // LongTensor: [n_seq, max_n_blocks]
  torch::Tensor block_offsets;

  // LongTensor: [n_tokens], positions of the packed tokens
  torch::Tensor position_ids;

  // LongTensor: [n_seq], offset of each sequence in the packed tokens
  torch::Tensor q_start_loc;

  // LongTensor: [n_seq, max_q_seq_length] for prefill, [n_seq, 1] for decode
  torch::Tensor attention_mask;

  // LongTensor: [n_seq]
  torch::Tensor history_lengths;

  // LongTensor: [n_seq]
  torch::Tensor q_seq_length;

  // LongTensor: [n_seq], kv length visible to the attention of each sequence
  torch::Tensor kv_seq_length;

  int64_t max_q_seq_length = 0;
  int64_t max_kv_seq_length = 0;

  std::vector<KVCache> kv_caches;

  bool is_decoding = false;

  int32_t world_size = 1;

  int32_t block_size = 0;

  // LongTensor: [n_seq]
  torch::Tensor local_adapter_ids;

  // adapter parameters keyed by target module, empty without adapters
  std::unordered_map<std::string, AdapterInfo> adapter_params;

  // vision embeddings of the step and their positions in the packed tokens
  torch::Tensor input_embeddings;
  torch::Tensor input_embedding_indexing;

  // extra tensors attached by the backend
  std::unordered_map<std::string, torch::Tensor> outputs;
};

}  // namespace pagestep
