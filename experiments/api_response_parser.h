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

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "experiments/experiments.pb.h"
#include "experiments/variation.h"

namespace content_experiments {

// Returns the JSON object assigned to `.experiments_` in a JavaScript API
// response. Braces are balanced by counting; string values are assumed not to
// contain braces.
absl::StatusOr<std::string> ExtractExperimentsJson(absl::string_view response);

absl::StatusOr<pb::ExperimentsResponse> ParseExperimentsJson(
    absl::string_view json);

// Turns the entry of `experiment_id` into selectable rows. Rows without a
// weight are dropped; the others keep their order.
absl::StatusOr<std::vector<VariationRecord>> ToVariationRecords(
    const pb::ExperimentsResponse& response, absl::string_view experiment_id);

// Extracts, parses and converts in one go.
absl::StatusOr<std::vector<VariationRecord>> ParseApiResponse(
    absl::string_view response, absl::string_view experiment_id);

}  // namespace content_experiments
