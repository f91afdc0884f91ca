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
#include <vector>

#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "experiments/experiment_config.h"
#include "experiments/experiment_session.h"

namespace content_experiments {

// A cookie to be set on the response, value unencoded.
struct Cookie {
  std::string name;
  std::string value;
  absl::Time expires;
  std::string path;
  std::string domain;
  bool secure = false;
  bool http_only = false;
};

// Returns the raw value of cookie `name` in a request Cookie header.
std::optional<std::string> FindCookie(absl::string_view cookie_header,
                                      absl::string_view name);

// The __utmx and __utmxx cookies exactly as the tracking client sets them:
// domain "." + `domain_name`, secure and HttpOnly off.
std::vector<Cookie> BuildExperimentCookies(const ExperimentConfig& config,
                                           absl::string_view domain_name,
                                           const CookieValues& values,
                                           absl::Time now);

// Renders a Set-Cookie header value. Max-Age is computed against `now`.
std::string FormatSetCookie(const Cookie& cookie, absl::Time now);

}  // namespace content_experiments
