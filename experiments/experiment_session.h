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
#include <optional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "experiments/data_provider.h"

namespace content_experiments {

// New values for the assignment (__utmx) and timestamp (__utmxx) cookies.
struct CookieValues {
  std::string assignment;
  std::string timestamp;
};

struct VariationDecision {
  int variation = kNoChosenVariation;
  CookieValues cookies;
  // False when a prior assignment was reused and `cookies` echo the input.
  bool cookies_updated = false;
};

// Decides which variation a visitor sees, mirroring the tracking client's
// chooseVariation(), getChosenVariation() and setChosenVariation().
//
// The session holds no per-visitor state; every call is a function of its
// arguments and of the rows returned by the provider.
class ExperimentSession {
 public:
  // `provider` must outlive the session.
  explicit ExperimentSession(ExperimentDataProvider* provider)
      : provider_(provider) {}

  // Reuses the variation stored in `assignment_cookie` when there is a
  // non-zero one. Otherwise draws a new variation with `draw` (uniform in
  // [0, 1)) and rewrites both cookies with `now` (seconds since the epoch)
  // and `domain_name`.
  //
  // A stored 0 (the original) is treated like a missing assignment and leads
  // to a fresh draw, exactly as the tracking client does. So is a stored
  // kNotParticipating: "-2" decodes to 0 since only the text before the
  // first '-' is read.
  absl::StatusOr<VariationDecision> ChooseVariation(
      absl::string_view experiment_id, absl::string_view assignment_cookie,
      absl::string_view timestamp_cookie, double draw, int64_t now,
      absl::string_view domain_name);

  // Runs the weighted selection without looking at any cookie.
  absl::StatusOr<int> ChooseNewVariation(absl::string_view experiment_id,
                                         double draw);

  static std::optional<int> GetChosenVariation(
      absl::string_view experiment_id, absl::string_view assignment_cookie);

  // Records `variation` in both cookies unconditionally.
  static CookieValues SetChosenVariation(absl::string_view experiment_id,
                                         int variation,
                                         absl::string_view assignment_cookie,
                                         absl::string_view timestamp_cookie,
                                         int64_t now,
                                         absl::string_view domain_name);

 private:
  ExperimentDataProvider* provider_;
};

}  // namespace content_experiments
