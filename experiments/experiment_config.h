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
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace content_experiments {

inline constexpr absl::string_view kDefaultApiUrl =
    "http://www.google-analytics.com/cx/api.js";
// Takes the cookie domain from the Host of each request.
inline constexpr absl::string_view kAutoDomainName = "auto";

// Settings shared by every decision. Built once at startup and treated as
// read-only afterwards.
struct ExperimentConfig {
  // Endpoint serving the experiment definitions.
  std::string api_url = std::string(kDefaultApiUrl);
  absl::Duration connect_timeout = absl::Seconds(2);
  absl::Duration timeout = absl::Seconds(2);
  // Domain the tracking client is configured with, lower case. "auto" takes
  // it from the request.
  std::string domain_name = std::string(kAutoDomainName);
  std::string cookie_path = "/";
  absl::Duration cookie_expiration = absl::Seconds(48211200);
  // Directory for cached API responses. Caching is off when empty.
  std::string cache_dir;
  // How long a cached response is used before the weights are fetched again.
  absl::Duration cache_ttl = absl::Seconds(60);
};

// Setters applying the normalization every consumer relies on.
void SetDomainName(ExperimentConfig* config, absl::string_view domain_name);
void SetCacheDir(ExperimentConfig* config, absl::string_view cache_dir);

// Reads a YAML map such as
//
//   domain_name: example.com
//   cache_dir: /var/cache/experiments
//   cache_ttl_seconds: 120
//
// on top of the defaults. Unknown keys and ill-typed values are rejected with
// kInvalidArgument.
absl::StatusOr<ExperimentConfig> ParseExperimentConfigYaml(
    const std::string& yaml);
absl::StatusOr<ExperimentConfig> LoadExperimentConfigFile(
    const std::string& path);

// Returns the domain cookies are written for. With "auto" this is `host`
// lower-cased and without its port. Fails with a configuration error when no
// domain can be determined.
absl::StatusOr<std::string> ResolveDomainName(
    const ExperimentConfig& config, std::optional<absl::string_view> host);

}  // namespace content_experiments
