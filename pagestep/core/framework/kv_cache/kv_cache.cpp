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

#include "kv_cache.h"

#include <glog/logging.h>

namespace pagestep {

KVCache::KVCache(torch::Tensor key_cache, torch::Tensor value_cache)
    : key_cache_(std::move(key_cache)), value_cache_(std::move(value_cache)) {
  CHECK_GE(key_cache_.dim(), 2) << "kv cache should be blocked";
  CHECK_EQ(key_cache_.size(0), value_cache_.size(0))
      << "key and value caches should have the same number of blocks";
  CHECK_EQ(key_cache_.size(1), value_cache_.size(1))
      << "key and value caches should have the same block size";
}

int64_t KVCache::num_blocks() const {
  return empty() ? 0 : key_cache_.size(0);
}

int64_t KVCache::block_size() const {
  return empty() ? 0 : key_cache_.size(1);
}

}  // namespace pagestep
