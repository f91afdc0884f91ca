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

#include "experiments/errors.h"

#include "absl/strings/cord.h"

namespace content_experiments {
namespace {

constexpr absl::string_view kConfigurationPayload = "configuration";
constexpr absl::string_view kDataProviderPayload = "data_provider";

absl::Status WithKind(absl::StatusCode code, absl::string_view message,
                      absl::string_view kind) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindPayloadUrl, absl::Cord(kind));
  return status;
}

}  // namespace

absl::Status ConfigurationError(absl::StatusCode code,
                                absl::string_view message) {
  return WithKind(code, message, kConfigurationPayload);
}

absl::Status ConfigurationError(absl::string_view message) {
  return ConfigurationError(absl::StatusCode::kFailedPrecondition, message);
}

absl::Status DataProviderError(absl::StatusCode code,
                               absl::string_view message) {
  return WithKind(code, message, kDataProviderPayload);
}

std::optional<ErrorKind> GetErrorKind(const absl::Status& status) {
  const absl::optional<absl::Cord> payload =
      status.GetPayload(kErrorKindPayloadUrl);
  if (!payload.has_value()) {
    return std::nullopt;
  }
  if (*payload == kConfigurationPayload) {
    return ErrorKind::kConfiguration;
  }
  if (*payload == kDataProviderPayload) {
    return ErrorKind::kDataProvider;
  }
  return std::nullopt;
}

}  // namespace content_experiments
