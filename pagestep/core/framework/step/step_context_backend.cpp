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

#include "step_context_backend.h"

#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include <algorithm>

#include "common/global_flags.h"
#include "flashinfer_step_context_backend.h"
#include "step_context.h"

namespace pagestep {

StepContext DefaultStepContextBackend::update_step_context(
    StepContext ctx) const {
  return ctx;
}

StepContextBackendFactory& StepContextBackendFactory::get_instance() {
  static StepContextBackendFactory factory;
  return factory;
}

bool StepContextBackendFactory::register_creator(const std::string& name,
                                                 Creator creator) {
  if (creators_.find(name) != creators_.end()) {
    LOG(WARNING) << "step context backend " << name
                 << " is already registered";
    return false;
  }
  creators_[name] = std::move(creator);
  return true;
}

bool StepContextBackendFactory::has_backend(const std::string& name) const {
  return creators_.find(name) != creators_.end();
}

std::vector<std::string> StepContextBackendFactory::backend_names() const {
  std::vector<std::string> names;
  names.reserve(creators_.size());
  for (const auto& pair : creators_) {
    names.push_back(pair.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

std::unique_ptr<StepContextBackend> StepContextBackendFactory::create_backend(
    const std::string& name) const {
  auto it = creators_.find(name);
  if (it == creators_.end()) {
    LOG(FATAL) << "Unsupported step context backend: " << name
               << "\nAvailable backends are: "
               << absl::StrJoin(backend_names(), ", ");
  }
  return it->second();
}

const StepContextBackend& get_backend() {
  static const std::unique_ptr<StepContextBackend> backend = [] {
    LOG(INFO) << "Using step context backend: " << FLAGS_step_context_backend;
    return StepContextBackendFactory::get_instance().create_backend(
        FLAGS_step_context_backend);
  }();
  return *backend;
}

// registered here so that the static library keeps the backends
REGISTER_STEP_CONTEXT_BACKEND("default", DefaultStepContextBackend);
REGISTER_STEP_CONTEXT_BACKEND("flashinfer", FlashInferStepContextBackend);

}  // namespace pagestep
