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

#include "absl/strings/string_view.h"

namespace content_experiments {

// Wire format of the two tracking cookies. Both values are '.'-separated with
// the domain hash as the first field. Experiment fields look like
//
//   assignment (__utmx):  <experiment id>$<tag>:<variation>[-<legacy>...]
//   timestamp  (__utmxx): <experiment id>$<tag>:<timestamp>:<ttl>[:<trailing>]
//
// e.g. "159991919.ft-5xaLPSturFXCPgoFrKg$0:1.ft-6uzLPSelrFQsPgouIkD$0:2".
// Fields that do not follow the grammar are never an error: they are skipped
// when searching and kept verbatim when a value is rewritten.
inline constexpr char kAssignmentCookieName[] = "__utmx";
inline constexpr char kTimestampCookieName[] = "__utmxx";

inline constexpr absl::string_view kFieldSeparator = ".";
inline constexpr absl::string_view kExperimentSeparator = "$";
inline constexpr absl::string_view kValueSeparator = ":";
inline constexpr absl::string_view kNewFieldTag = "0";

// Hardcoded in the tracking client; must not be made configurable.
inline constexpr int64_t kTimestampCookieTtl = 8035200;

struct AssignmentField {
  std::string experiment_id;
  // Opaque, carried through untouched. Observed as "0".
  std::string tag;
  // Raw variation text. Only the part before the first '-' is meaningful.
  std::string variation;
};

struct TimestampField {
  std::string experiment_id;
  std::string tag;
  std::string timestamp;
  std::string ttl;
  // Opaque trailing segment. Empty when absent.
  std::string trailing;
};

std::optional<AssignmentField> ParseAssignmentField(absl::string_view field);
std::optional<TimestampField> ParseTimestampField(absl::string_view field);
std::string FormatAssignmentField(const AssignmentField& field);
std::string FormatTimestampField(const TimestampField& field);

// Returns the variation recorded for `experiment_id` in an assignment cookie
// value, or nullopt when the value holds no field for it. A field whose
// variation is not numeric decodes to 0.
std::optional<int> DecodeAssignment(absl::string_view cookie,
                                    absl::string_view experiment_id);

// Returns a new assignment cookie value recording `variation` for
// `experiment_id`. The domain hash of `previous` is reused when `previous`
// holds at least two fields, otherwise it is computed from `domain_name`.
std::string UpdateAssignmentCookie(absl::string_view previous,
                                   absl::string_view experiment_id,
                                   int variation,
                                   absl::string_view domain_name);

// Returns a new timestamp cookie value stamping `experiment_id` with `now`
// (seconds since the epoch). Same domain hash rule as above.
std::string UpdateTimestampCookie(absl::string_view previous,
                                  absl::string_view experiment_id, int64_t now,
                                  absl::string_view domain_name);

}  // namespace content_experiments
