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

#include "flashinfer_step_context_backend.h"

#include <glog/logging.h>

#include "step_context.h"
#include "util/tensor_helper.h"

namespace pagestep {

StepContext FlashInferStepContextBackend::update_step_context(
    StepContext ctx) const {
  const int64_t block_size = ctx.block_size;
  CHECK_GT(block_size, 0) << "flashinfer backend requires the block size";
  CHECK(ctx.block_offsets.defined()) << "flashinfer backend requires blocks";

  const std::vector<int64_t> kv_lens = to_vector<int64_t>(ctx.kv_seq_length);
  const auto block_table =
      ctx.block_offsets.to(torch::kCPU).to(torch::kLong).contiguous();
  CHECK_EQ(block_table.size(0), static_cast<int64_t>(kv_lens.size()));
  const auto blocks = block_table.accessor<int64_t, 2>();

  int64_t num_cache_blocks = -1;
  if (!ctx.kv_caches.empty() && !ctx.kv_caches.front().empty()) {
    const KVCache& kv_cache = ctx.kv_caches.front();
    CHECK_EQ(kv_cache.block_size(), block_size)
        << "kv cache block size does not match the cache config";
    num_cache_blocks = kv_cache.num_blocks();
  }

  std::vector<int32_t> paged_kv_indptr = {0};
  std::vector<int32_t> paged_kv_indices;
  std::vector<int32_t> paged_kv_last_page_len;
  paged_kv_last_page_len.reserve(kv_lens.size());
  for (size_t i = 0; i < kv_lens.size(); ++i) {
    const int64_t kv_len = kv_lens[i];
    const int64_t n_pages = (kv_len + block_size - 1) / block_size;
    CHECK_LE(n_pages, block_table.size(1))
        << "sequence " << i << " with " << kv_len
        << " kv tokens exceeds its block table";
    for (int64_t j = 0; j < n_pages; ++j) {
      const int64_t block_id = blocks[i][j];
      CHECK(num_cache_blocks < 0 || block_id < num_cache_blocks)
          << "block " << block_id << " of sequence " << i
          << " is outside of the kv cache with " << num_cache_blocks
          << " blocks";
      paged_kv_indices.push_back(static_cast<int32_t>(block_id));
    }
    paged_kv_indptr.push_back(paged_kv_indptr.back() +
                              static_cast<int32_t>(n_pages));
    paged_kv_last_page_len.push_back(
        n_pages == 0 ? 0
                     : static_cast<int32_t>(kv_len - (n_pages - 1) * block_size));
  }

  const auto device = ctx.kv_seq_length.device();
  ctx.outputs["paged_kv_indptr"] =
      torch::tensor(paged_kv_indptr, torch::kInt).to(device);
  ctx.outputs["paged_kv_indices"] =
      torch::tensor(paged_kv_indices, torch::kInt).to(device);
  ctx.outputs["paged_kv_last_page_len"] =
      torch::tensor(paged_kv_last_page_len, torch::kInt).to(device);
  return ctx;
}

}  // namespace pagestep
