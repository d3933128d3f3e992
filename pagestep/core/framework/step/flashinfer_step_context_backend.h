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

#include "step_context_backend.h"

namespace pagestep {

// Attaches the paged kv layout used by flashinfer style attention kernels:
//   paged_kv_indptr:        IntTensor [n_seq + 1], prefix sum of used pages
//   paged_kv_indices:       IntTensor [n_pages], used block ids of all seqs
//   paged_kv_last_page_len: IntTensor [n_seq], tokens in the last used page
class FlashInferStepContextBackend final : public StepContextBackend {
 public:
  StepContext update_step_context(StepContext ctx) const override;
};

}  // namespace pagestep
