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

#include "experiments/hash.h"

namespace content_experiments {

uint32_t DomainHash(absl::string_view input) {
  if (input.empty()) {
    return 1;
  }

  uint32_t hash = 0;
  // Bytes are consumed from last to first.
  for (auto it = input.rbegin(); it != input.rend(); ++it) {
    const uint32_t c = static_cast<unsigned char>(*it);
    hash = ((hash << 6) & 0xfffffff) + c + (c << 14);
    const uint32_t left_most_7 = hash & 0xfe00000;
    if (left_most_7 != 0) {
      hash ^= left_most_7 >> 21;
    }
  }
  return hash;
}

}  // namespace content_experiments
