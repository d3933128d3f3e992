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

#include "cache_config.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "common/global_flags.h"

namespace pagestep {

CacheConfig CacheConfig::from_flags() {
  CHECK_GT(FLAGS_block_size, 0) << "block_size should be positive";
  CHECK_GE(FLAGS_window_size, 0) << "window_size should not be negative";
  CHECK_EQ(FLAGS_max_prefill_token_num % FLAGS_block_size, 0)
      << "max_prefill_token_num " << FLAGS_max_prefill_token_num
      << " should be a multiple of block_size " << FLAGS_block_size;

  CacheConfig config;
  config.block_size(FLAGS_block_size)
      .window_size(FLAGS_window_size)
      .num_gpu_blocks(FLAGS_num_gpu_blocks)
      .max_prefill_token_num(FLAGS_max_prefill_token_num);
  return config;
}

std::string CacheConfig::to_string() const {
  return absl::StrCat("CacheConfig{block_size=",
                      block_size_,
                      ", window_size=",
                      window_size_,
                      ", num_gpu_blocks=",
                      num_gpu_blocks_,
                      ", max_prefill_token_num=",
                      max_prefill_token_num_,
                      "}");
}

}  // namespace pagestep
