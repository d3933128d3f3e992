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

#include <c10/core/TensorOptions.h>
#include <glog/logging.h>
#include <torch/torch.h>

#include <algorithm>
#include <string>
#include <vector>

namespace pagestep {

inline torch::Tensor safe_to(const torch::Tensor& t,
                             const torch::Device& device,
                             bool non_blocking = false) {
  return t.defined() ? t.to(device, non_blocking) : t;
}

// copy a small 1-D metadata tensor to a host vector.
template <typename T>
inline std::vector<T> to_vector(const torch::Tensor& t) {
  if (!t.defined()) {
    return {};
  }
  const auto host = t.to(torch::kCPU)
                        .to(c10::CppTypeToScalarType<T>::value)
                        .contiguous()
                        .view(-1);
  const T* data = host.data_ptr<T>();
  return std::vector<T>(data, data + host.numel());
}

inline void print_tensor(const torch::Tensor& tensor,
                         const std::string& tensor_name = "tensor",
                         int num = 10) {
  if (!tensor.defined()) {
    LOG(INFO) << tensor_name << ", Undefined tensor.";
    return;
  }

  LOG(INFO) << tensor_name << ": " << tensor.sizes()
            << ", dtype: " << tensor.dtype() << ", device: " << tensor.device();

  const auto& flat_tensor = tensor.contiguous().view(-1);
  const int64_t max_elements = std::min<int64_t>(flat_tensor.size(0), num);
  const auto& front_elements =
      flat_tensor.slice(0, 0, max_elements).to(torch::kCPU);
  LOG(INFO) << "First " << max_elements << " elements: \n" << front_elements;
}

}  // namespace pagestep
