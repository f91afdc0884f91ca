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

#include "experiments/cookies.h"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "experiments/cookie_codec.h"

namespace content_experiments {

std::optional<std::string> FindCookie(absl::string_view cookie_header,
                                      absl::string_view name) {
  for (absl::string_view sp : absl::StrSplit(cookie_header, ';')) {
    const std::pair<absl::string_view, absl::string_view> cookie =
        absl::StrSplit(absl::StripLeadingAsciiWhitespace(sp),
                       absl::MaxSplits('=', 1));
    if (cookie.first == name) {
      return std::string(cookie.second);
    }
  }
  return std::nullopt;
}

std::vector<Cookie> BuildExperimentCookies(const ExperimentConfig& config,
                                           absl::string_view domain_name,
                                           const CookieValues& values,
                                           absl::Time now) {
  std::vector<Cookie> cookies(2);
  cookies[0].name = kAssignmentCookieName;
  cookies[0].value = values.assignment;
  cookies[1].name = kTimestampCookieName;
  cookies[1].value = values.timestamp;
  for (Cookie& cookie : cookies) {
    cookie.expires = now + config.cookie_expiration;
    cookie.path = config.cookie_path;
    cookie.domain = absl::StrCat(".", domain_name);
  }
  return cookies;
}

std::string FormatSetCookie(const Cookie& cookie, absl::Time now) {
  const int64_t max_age =
      std::max<int64_t>(0, absl::ToInt64Seconds(cookie.expires - now));
  std::string out = absl::StrCat(
      cookie.name, "=", cookie.value, "; expires=",
      absl::FormatTime("%a, %d %b %Y %H:%M:%S GMT", cookie.expires,
                       absl::UTCTimeZone()),
      "; Max-Age=", max_age);
  if (!cookie.path.empty()) {
    absl::StrAppend(&out, "; path=", cookie.path);
  }
  if (!cookie.domain.empty()) {
    absl::StrAppend(&out, "; domain=", cookie.domain);
  }
  if (cookie.secure) {
    absl::StrAppend(&out, "; secure");
  }
  if (cookie.http_only) {
    absl::StrAppend(&out, "; HttpOnly");
  }
  return out;
}

}  // namespace content_experiments
