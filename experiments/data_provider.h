// Copyright 2025 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "experiments/variation.h"

namespace content_experiments {

// Source of experiment definitions. Failures are reported with
// ErrorKind::kDataProvider and are fatal to the decision at hand.
class ExperimentDataProvider {
 public:
  virtual ~ExperimentDataProvider() = default;

  // Returns the ordered variation rows of `experiment_id`.
  virtual absl::StatusOr<std::vector<VariationRecord>> Fetch(
      absl::string_view experiment_id) = 0;
};

}  // namespace content_experiments
