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

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace content_experiments {

// Failure categories a caller can tell apart. Malformed cookies and an
// exhausted weight scan are not failures and have no kind.
enum class ErrorKind {
  // The decision cannot be made because the service is misconfigured, e.g.
  // the cookie domain cannot be determined.
  kConfiguration,
  // Experiment weights could not be retrieved or understood.
  kDataProvider,
};

// Payload key under which the error kind is attached to a status.
inline constexpr absl::string_view kErrorKindPayloadUrl =
    "type.googleapis.com/content_experiments.ErrorKind";

absl::Status ConfigurationError(absl::StatusCode code,
                                absl::string_view message);
absl::Status ConfigurationError(absl::string_view message);
absl::Status DataProviderError(absl::StatusCode code,
                               absl::string_view message);

// Returns the kind attached by one of the constructors above, if any.
std::optional<ErrorKind> GetErrorKind(const absl::Status& status);

}  // namespace content_experiments
