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

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/macros.h"

namespace pagestep {

struct StepContext;

// Hardware specific post-processing of a freshly built step context. A
// backend may attach extra tensors but must keep the lengths and masks
// already derived.
class StepContextBackend {
 public:
  virtual ~StepContextBackend() = default;

  virtual StepContext update_step_context(StepContext ctx) const = 0;
};

class DefaultStepContextBackend final : public StepContextBackend {
 public:
  StepContext update_step_context(StepContext ctx) const override;
};

class StepContextBackendFactory {
 public:
  using Creator = std::function<std::unique_ptr<StepContextBackend>()>;

  static StepContextBackendFactory& get_instance();

  bool register_creator(const std::string& name, Creator creator);

  bool has_backend(const std::string& name) const;

  std::vector<std::string> backend_names() const;

  std::unique_ptr<StepContextBackend> create_backend(
      const std::string& name) const;

  DISALLOW_COPY_AND_ASSIGN(StepContextBackendFactory);

 private:
  StepContextBackendFactory() = default;

  ~StepContextBackendFactory() = default;

  std::unordered_map<std::string, Creator> creators_;
};

// the backend selected by --step_context_backend, created on first use.
const StepContextBackend& get_backend();

#define REGISTER_STEP_CONTEXT_BACKEND(name, class_type)                \
  namespace {                                                          \
  bool class_type##_registered = []() -> bool {                        \
    return StepContextBackendFactory::get_instance().register_creator( \
        name, []() -> std::unique_ptr<StepContextBackend> {            \
          return std::make_unique<class_type>();                       \
        });                                                            \
  }();                                                                 \
  }

}  // namespace pagestep
