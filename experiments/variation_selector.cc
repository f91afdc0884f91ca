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

#include "experiments/variation.h"

namespace content_experiments {

int SelectVariation(absl::Span<const VariationRecord> records, double draw) {
  double remaining = draw;
  for (const VariationRecord& record : records) {
    // Disabled rows usually carry a zero weight; skip them regardless.
    if (record.disabled) {
      continue;
    }
    if (remaining < record.weight) {
      return record.variation_id.value_or(kNotParticipating);
    }
    remaining -= record.weight;
  }
  return kOriginalVariation;
}

}  // namespace content_experiments
