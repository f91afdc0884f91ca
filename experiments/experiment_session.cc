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

#include "experiments/experiment_session.h"

#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "experiments/cookie_codec.h"
#include "experiments/errors.h"

namespace content_experiments {

absl::StatusOr<VariationDecision> ExperimentSession::ChooseVariation(
    absl::string_view experiment_id, absl::string_view assignment_cookie,
    absl::string_view timestamp_cookie, double draw, int64_t now,
    absl::string_view domain_name) {
  const std::optional<int> chosen =
      GetChosenVariation(experiment_id, assignment_cookie);
  if (chosen.has_value() && *chosen != kOriginalVariation) {
    VariationDecision decision;
    decision.variation = *chosen;
    decision.cookies.assignment = std::string(assignment_cookie);
    decision.cookies.timestamp = std::string(timestamp_cookie);
    return decision;
  }

  // The cookie domain is needed for the rewrite; fail before any fetch.
  if (domain_name.empty()) {
    return ConfigurationError(
        absl::StrCat("unable to determine the cookie domain for experiment ",
                     experiment_id));
  }

  absl::StatusOr<int> variation = ChooseNewVariation(experiment_id, draw);
  if (!variation.ok()) {
    return variation.status();
  }

  VariationDecision decision;
  decision.variation = *variation;
  decision.cookies =
      SetChosenVariation(experiment_id, *variation, assignment_cookie,
                         timestamp_cookie, now, domain_name);
  decision.cookies_updated = true;
  return decision;
}

absl::StatusOr<int> ExperimentSession::ChooseNewVariation(
    absl::string_view experiment_id, double draw) {
  absl::StatusOr<std::vector<VariationRecord>> records =
      provider_->Fetch(experiment_id);
  if (!records.ok()) {
    return records.status();
  }
  return SelectVariation(*records, draw);
}

std::optional<int> ExperimentSession::GetChosenVariation(
    absl::string_view experiment_id, absl::string_view assignment_cookie) {
  return DecodeAssignment(assignment_cookie, experiment_id);
}

CookieValues ExperimentSession::SetChosenVariation(
    absl::string_view experiment_id, int variation,
    absl::string_view assignment_cookie, absl::string_view timestamp_cookie,
    int64_t now, absl::string_view domain_name) {
  CookieValues values;
  values.assignment = UpdateAssignmentCookie(assignment_cookie, experiment_id,
                                             variation, domain_name);
  values.timestamp =
      UpdateTimestampCookie(timestamp_cookie, experiment_id, now, domain_name);
  return values;
}

}  // namespace content_experiments
