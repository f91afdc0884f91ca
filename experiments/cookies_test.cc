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

#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::Optional;

namespace content_experiments {
namespace {

constexpr int64_t kNow = 1380888455;

TEST(FindCookieTest, FindsRawValue) {
  constexpr absl::string_view kHeader =
      "_ga=GA1.2.3; __utmx=159991919.exp$0:1; "
      "__utmxx=159991919.exp$0:1:8035200";
  EXPECT_THAT(FindCookie(kHeader, "__utmx"),
              Optional(std::string("159991919.exp$0:1")));
  EXPECT_THAT(FindCookie(kHeader, "__utmxx"),
              Optional(std::string("159991919.exp$0:1:8035200")));
  EXPECT_EQ(FindCookie(kHeader, "__utm"), std::nullopt);
}

TEST(FindCookieTest, ToleratesMissingSpacesAndEmptyValues) {
  EXPECT_THAT(FindCookie("a=1;__utmx=;b=2", "__utmx"),
              Optional(std::string("")));
  EXPECT_THAT(FindCookie("a=1;b=x=y", "b"), Optional(std::string("x=y")));
  EXPECT_EQ(FindCookie("", "__utmx"), std::nullopt);
}

TEST(FindCookieTest, FirstOccurrenceWins) {
  EXPECT_THAT(FindCookie("__utmx=1.a$0:1; __utmx=2.a$0:2", "__utmx"),
              Optional(std::string("1.a$0:1")));
}

TEST(BuildExperimentCookiesTest, MatchesTrackingClient) {
  const ExperimentConfig config;
  const absl::Time now = absl::FromUnixSeconds(kNow);
  const std::vector<Cookie> cookies = BuildExperimentCookies(
      config, "example.com", {"60493049.exp$0:1", "60493049.exp$0:5:8035200"},
      now);
  ASSERT_EQ(cookies.size(), 2u);

  EXPECT_EQ(cookies[0].name, "__utmx");
  EXPECT_EQ(cookies[0].value, "60493049.exp$0:1");
  EXPECT_EQ(cookies[1].name, "__utmxx");
  EXPECT_EQ(cookies[1].value, "60493049.exp$0:5:8035200");
  for (const Cookie& cookie : cookies) {
    EXPECT_EQ(cookie.expires, now + absl::Seconds(48211200));
    EXPECT_EQ(cookie.path, "/");
    EXPECT_EQ(cookie.domain, ".example.com");
    EXPECT_FALSE(cookie.secure);
    EXPECT_FALSE(cookie.http_only);
  }
}

TEST(FormatSetCookieTest, TrackingCookie) {
  const ExperimentConfig config;
  const absl::Time now = absl::FromUnixSeconds(kNow);
  const std::vector<Cookie> cookies = BuildExperimentCookies(
      config, "example.com", {"60493049.exp$0:1", ""}, now);
  EXPECT_EQ(FormatSetCookie(cookies[0], now),
            "__utmx=60493049.exp$0:1; expires=Wed, 15 Apr 2015 12:07:35 GMT; "
            "Max-Age=48211200; path=/; domain=.example.com");
}

TEST(FormatSetCookieTest, Flags) {
  Cookie cookie;
  cookie.name = "n";
  cookie.value = "v";
  cookie.expires = absl::FromUnixSeconds(kNow - 10);
  cookie.secure = true;
  cookie.http_only = true;
  EXPECT_EQ(FormatSetCookie(cookie, absl::FromUnixSeconds(kNow)),
            "n=v; expires=Fri, 04 Oct 2013 12:07:25 GMT; Max-Age=0; secure; "
            "HttpOnly");
}

}  // namespace
}  // namespace content_experiments
