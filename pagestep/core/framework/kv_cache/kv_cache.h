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

#include <cstdint>
#include <vector>

namespace pagestep {

// Per-layer paged kv cache. Both tensors are laid out as
// [num_blocks, block_size, num_kv_heads, head_dim]. The storage is owned by
// the cache allocator, KVCache only holds references to it.
class KVCache final {
 public:
  KVCache() = default;
  KVCache(torch::Tensor key_cache, torch::Tensor value_cache);
  ~KVCache() = default;

  torch::Tensor get_k_cache() const { return key_cache_; }
  torch::Tensor get_v_cache() const { return value_cache_; }

  bool empty() const { return !key_cache_.defined() || !value_cache_.defined(); }

  int64_t num_blocks() const;
  int64_t block_size() const;

 private:
  torch::Tensor key_cache_;
  torch::Tensor value_cache_;
};

}  // namespace pagestep
