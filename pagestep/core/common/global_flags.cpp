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

#include "global_flags.h"

// NOTE: related flags should be placed together.

// --- kv cache config ---

DEFINE_int32(block_size, 16, "Number of tokens held by one kv cache block.");

DEFINE_int32(window_size,
             0,
             "Sliding window size of the attention. kv history older than "
             "the window is ignored. 0 disables the sliding window.");

DEFINE_int64(num_gpu_blocks,
             0,
             "Number of kv cache blocks allocated on device. 0 means decided "
             "by the cache allocator.");

DEFINE_int32(max_prefill_token_num,
             4096,
             "Max tokens processed by one prefill step, longer prompts are "
             "split into chunks of this size. Must be a multiple of "
             "block_size.");

// --- backend config ---

DEFINE_string(step_context_backend,
              "default",
              "Backend used to post-process the step context, e.g. default, "
              "flashinfer.");
