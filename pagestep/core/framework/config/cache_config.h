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

#include <cstdint>
#include <string>

#include "common/macros.h"

namespace pagestep {

class CacheConfig {
 public:
  CacheConfig() = default;
  ~CacheConfig() = default;

  // build a config from the command line flags.
  static CacheConfig from_flags();

  std::string to_string() const;

 private:
  // number of tokens per kv cache block
  PROPERTY(int32_t, block_size) = 16;

  // sliding window of the attention, 0 disables the window
  PROPERTY(int32_t, window_size) = 0;

  // kv cache blocks per layer on device, 0 lets the caller size the cache
  PROPERTY(int64_t, num_gpu_blocks) = 0;

  // split size of chunked prefill, should be a multiple of block_size
  PROPERTY(int32_t, max_prefill_token_num) = 4096;
};

}  // namespace pagestep
