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

#include <cstdint>

#include "absl/strings/string_view.h"

namespace content_experiments {

// Computes the domain hash that prefixes every tracking cookie value. The
// result must match the tracking client bit for bit, so all arithmetic is
// done on 32-bit unsigned values with the shifted accumulator masked to
// 28 bits. Returns 1 for an empty input.
uint32_t DomainHash(absl::string_view input);

}  // namespace content_experiments
