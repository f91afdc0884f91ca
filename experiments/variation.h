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

#include <optional>

#include "absl/types/span.h"

namespace content_experiments {

// Reserved variation numbers shared with the tracking client.
constexpr int kOriginalVariation = 0;
// Unset marker for callers. Never produced by selection.
constexpr int kNoChosenVariation = -1;
constexpr int kNotParticipating = -2;

// One row of an experiment definition. The order of rows is significant and
// must be kept exactly as received.
struct VariationRecord {
  // Empty when a visitor landing on this row is excluded from the experiment.
  std::optional<int> variation_id;
  double weight = 0;
  bool disabled = false;
};

// Picks a variation by walking the cumulative weights of the enabled records
// in order. `draw` is a uniform random number in [0, 1) supplied by the
// caller. Probability mass not covered by the weights falls through to
// kOriginalVariation.
int SelectVariation(absl::Span<const VariationRecord> records, double draw);

}  // namespace content_experiments
