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

#include <gflags/gflags.h>
#include <glog/logging.h>
#include <torch/torch.h>

#include <vector>

#include "core/framework/config/cache_config.h"
#include "core/framework/kv_cache/kv_cache.h"
#include "core/framework/model/model_inputs.h"
#include "core/framework/step/step_context_manager.h"

DEFINE_int32(prompt_len, 100, "Number of prompt tokens to replay.");

DEFINE_int32(decode_steps, 4, "Number of decode steps after the prefill.");

DEFINE_int32(num_layers, 2, "Number of kv cache layers to allocate.");

DEFINE_string(device, "cpu", "Device of the step tensors, e.g. cpu, cuda:0.");

using namespace pagestep;

namespace {

std::vector<KVCache> allocate_kv_caches(int64_t num_blocks,
                                        int64_t block_size,
                                        const torch::Device& device) {
  const auto options = torch::TensorOptions().device(device);
  std::vector<KVCache> kv_caches;
  kv_caches.reserve(FLAGS_num_layers);
  for (int32_t i = 0; i < FLAGS_num_layers; ++i) {
    kv_caches.emplace_back(
        torch::zeros({num_blocks, block_size, /*n_heads=*/1, /*head_dim=*/8},
                     options),
        torch::zeros({num_blocks, block_size, 1, 8}, options));
  }
  return kv_caches;
}

ModelInputs make_prompt_inputs(int64_t prompt_len, int64_t num_blocks) {
  ModelInputs inputs;
  inputs.input_ids =
      torch::arange(prompt_len, torch::kLong).view({1, prompt_len});
  inputs.seq_length = torch::tensor({prompt_len}, torch::kLong);
  inputs.history_lengths = torch::zeros({1}, torch::kLong);
  inputs.block_offsets =
      torch::arange(num_blocks, torch::kLong).view({1, num_blocks});
  inputs.max_q_seq_length = prompt_len;
  inputs.max_history_length = 0;
  inputs.is_decoding = false;
  inputs.num_ignored_history = torch::zeros({1}, torch::kLong);
  return inputs;
}

void run_step(StepContextManager& manager,
              const ModelInputs& inputs,
              const std::vector<KVCache>& kv_caches,
              const CacheConfig& cache_config,
              const torch::Device& device) {
  const StepContext ctx = manager.build_context(
      inputs.to(device), /*world_size=*/1, kv_caches, cache_config);
  manager.with_context(ctx, [](const StepContext& current) {
    current.print();
  });
}

}  // namespace

int main(int argc, char** argv) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging("pagestep");

  const CacheConfig cache_config = CacheConfig::from_flags();
  LOG(INFO) << "Replaying a " << FLAGS_prompt_len << " token prompt with "
            << cache_config.to_string();
  CHECK_GT(FLAGS_prompt_len, 0);
  CHECK_GE(FLAGS_decode_steps, 0);

  const torch::Device device(FLAGS_device);
  const int64_t block_size = cache_config.block_size();
  const int64_t total_tokens = FLAGS_prompt_len + FLAGS_decode_steps;
  const int64_t num_blocks = (total_tokens + block_size - 1) / block_size;
  int64_t num_cache_blocks = cache_config.num_gpu_blocks();
  if (num_cache_blocks == 0) {
    num_cache_blocks = num_blocks;
  }
  CHECK_GE(num_cache_blocks, num_blocks)
      << "kv cache is too small for " << total_tokens << " tokens";
  const std::vector<KVCache> kv_caches =
      allocate_kv_caches(num_cache_blocks, block_size, device);

  StepContextManager& manager = StepContextManager::get_instance();

  // chunked prefill
  const ModelInputs prompt = make_prompt_inputs(FLAGS_prompt_len, num_blocks);
  const std::vector<ModelInputs> chunks =
      prompt.split(cache_config.max_prefill_token_num(), block_size);
  LOG(INFO) << "Prefill split into " << chunks.size() << " chunks";
  for (const auto& chunk : chunks) {
    run_step(manager, chunk, kv_caches, cache_config, device);
  }

  // decode
  ModelInputs decode = prompt;
  decode.input_ids = torch::full({1, 1}, FLAGS_prompt_len, torch::kLong);
  decode.seq_length = torch::ones({1}, torch::kLong);
  decode.history_lengths = torch::full({1}, FLAGS_prompt_len, torch::kLong);
  decode.max_q_seq_length = 1;
  decode.max_history_length = FLAGS_prompt_len;
  decode.is_decoding = true;
  for (int32_t step = 0; step < FLAGS_decode_steps; ++step) {
    run_step(manager, decode, kv_caches, cache_config, device);
    decode.update(torch::full({1}, FLAGS_prompt_len + step + 1, torch::kLong));
  }
  return 0;
}
