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

#include "experiments/cookie_codec.h"

#include <climits>
#include <vector>

#include "absl/functional/function_ref.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "experiments/hash.h"

namespace content_experiments {
namespace {

// Splits "<id>$<tag>:<rest>". Both id and tag must be non-empty.
bool SplitHead(absl::string_view field, absl::string_view* experiment_id,
               absl::string_view* tag, absl::string_view* rest) {
  const size_t dollar = field.find(kExperimentSeparator);
  if (dollar == absl::string_view::npos || dollar == 0) {
    return false;
  }
  const absl::string_view after = field.substr(dollar + 1);
  const size_t colon = after.find(kValueSeparator);
  if (colon == absl::string_view::npos || colon == 0) {
    return false;
  }
  *experiment_id = field.substr(0, dollar);
  *tag = after.substr(0, colon);
  *rest = after.substr(colon + 1);
  return true;
}

// Lenient integer conversion: leading whitespace, an optional sign and as
// many digits as are present. Anything else yields 0. Saturates on overflow.
int LeadingInt(absl::string_view text) {
  size_t i = 0;
  while (i < text.size() && absl::ascii_isspace(text[i])) {
    ++i;
  }
  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }
  int64_t value = 0;
  for (; i < text.size() && absl::ascii_isdigit(text[i]); ++i) {
    value = value * 10 + (text[i] - '0');
    if (value > INT_MAX) {
      return negative ? INT_MIN : INT_MAX;
    }
  }
  return static_cast<int>(negative ? -value : value);
}

// Rewrites a cookie value. `rewrite` returns the replacement for a field that
// belongs to the target experiment and nullopt for any other field. When no
// field was replaced, `new_field` is appended.
std::string RewriteCookie(
    absl::string_view previous, absl::string_view domain_name,
    absl::FunctionRef<std::optional<std::string>(absl::string_view)> rewrite,
    const std::string& new_field) {
  std::vector<std::string> fields = absl::StrSplit(previous, kFieldSeparator);
  if (fields.size() < 2) {
    return absl::StrCat(DomainHash(domain_name), kFieldSeparator, new_field);
  }

  bool found = false;
  for (auto it = fields.begin() + 1; it != fields.end(); ++it) {
    std::optional<std::string> replacement = rewrite(*it);
    if (replacement.has_value()) {
      *it = *std::move(replacement);
      found = true;
    }
  }
  if (!found) {
    fields.push_back(new_field);
  }
  return absl::StrJoin(fields, kFieldSeparator);
}

}  // namespace

std::optional<AssignmentField> ParseAssignmentField(absl::string_view field) {
  absl::string_view experiment_id, tag, rest;
  if (!SplitHead(field, &experiment_id, &tag, &rest)) {
    return std::nullopt;
  }
  return AssignmentField{std::string(experiment_id), std::string(tag),
                         std::string(rest)};
}

std::optional<TimestampField> ParseTimestampField(absl::string_view field) {
  absl::string_view experiment_id, tag, rest;
  if (!SplitHead(field, &experiment_id, &tag, &rest)) {
    return std::nullopt;
  }
  const size_t colon = rest.find(kValueSeparator);
  if (colon == absl::string_view::npos || colon == 0) {
    return std::nullopt;
  }
  const absl::string_view timestamp = rest.substr(0, colon);
  absl::string_view ttl = rest.substr(colon + 1);
  absl::string_view trailing;
  const size_t ttl_end = ttl.find(kValueSeparator);
  if (ttl_end != absl::string_view::npos) {
    trailing = ttl.substr(ttl_end + 1);
    ttl = ttl.substr(0, ttl_end);
  }
  if (ttl.empty()) {
    return std::nullopt;
  }
  return TimestampField{std::string(experiment_id), std::string(tag),
                        std::string(timestamp), std::string(ttl),
                        std::string(trailing)};
}

std::string FormatAssignmentField(const AssignmentField& field) {
  return absl::StrCat(field.experiment_id, kExperimentSeparator, field.tag,
                      kValueSeparator, field.variation);
}

std::string FormatTimestampField(const TimestampField& field) {
  std::string out = absl::StrCat(field.experiment_id, kExperimentSeparator,
                                 field.tag, kValueSeparator, field.timestamp,
                                 kValueSeparator, field.ttl);
  if (!field.trailing.empty()) {
    absl::StrAppend(&out, kValueSeparator, field.trailing);
  }
  return out;
}

std::optional<int> DecodeAssignment(absl::string_view cookie,
                                    absl::string_view experiment_id) {
  const std::vector<absl::string_view> fields =
      absl::StrSplit(cookie, kFieldSeparator);
  if (fields.size() < 2) {
    return std::nullopt;
  }
  for (auto it = fields.begin() + 1; it != fields.end(); ++it) {
    const std::optional<AssignmentField> field = ParseAssignmentField(*it);
    if (!field.has_value() || field->experiment_id != experiment_id) {
      continue;
    }
    // Older clients stored several '-'-separated variations; the first wins.
    const absl::string_view first =
        absl::string_view(field->variation)
            .substr(0, field->variation.find('-'));
    return LeadingInt(first);
  }
  return std::nullopt;
}

std::string UpdateAssignmentCookie(absl::string_view previous,
                                   absl::string_view experiment_id,
                                   int variation,
                                   absl::string_view domain_name) {
  const std::string value = absl::StrCat(variation);
  return RewriteCookie(
      previous, domain_name,
      [&](absl::string_view text) -> std::optional<std::string> {
        std::optional<AssignmentField> field = ParseAssignmentField(text);
        if (!field.has_value() || field->experiment_id != experiment_id) {
          return std::nullopt;
        }
        field->variation = value;
        return FormatAssignmentField(*field);
      },
      FormatAssignmentField(AssignmentField{
          std::string(experiment_id), std::string(kNewFieldTag), value}));
}

std::string UpdateTimestampCookie(absl::string_view previous,
                                  absl::string_view experiment_id, int64_t now,
                                  absl::string_view domain_name) {
  const std::string timestamp = absl::StrCat(now);
  return RewriteCookie(
      previous, domain_name,
      [&](absl::string_view text) -> std::optional<std::string> {
        std::optional<TimestampField> field = ParseTimestampField(text);
        if (!field.has_value() || field->experiment_id != experiment_id) {
          return std::nullopt;
        }
        field->timestamp = timestamp;
        return FormatTimestampField(*field);
      },
      FormatTimestampField(TimestampField{
          std::string(experiment_id), std::string(kNewFieldTag), timestamp,
          absl::StrCat(kTimestampCookieTtl), ""}));
}

}  // namespace content_experiments
