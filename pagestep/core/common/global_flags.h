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

#include <gflags/gflags.h>

// --- kv cache config ---

DECLARE_int32(block_size);

DECLARE_int32(window_size);

DECLARE_int64(num_gpu_blocks);

DECLARE_int32(max_prefill_token_num);

// --- backend config ---

DECLARE_string(step_context_backend);
