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

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::ElementsAre;
using ::testing::Optional;

namespace content_experiments {
namespace {

constexpr absl::string_view kTwoExperiments =
    "159991919.ft-5xaLPSturFXCPgoFrKg$0:1.ft-6uzLPSelrFQsPgouIkD$0:2";

// DomainHash("example.com").
constexpr absl::string_view kExampleHash = "60493049";

TEST(ParseFieldTest, AssignmentField) {
  const auto field = ParseAssignmentField("ft-5xaLPSturFXCPgoFrKg$0:1-3");
  ASSERT_TRUE(field.has_value());
  EXPECT_EQ(field->experiment_id, "ft-5xaLPSturFXCPgoFrKg");
  EXPECT_EQ(field->tag, "0");
  EXPECT_EQ(field->variation, "1-3");
}

TEST(ParseFieldTest, AssignmentFieldRejectsMalformed) {
  EXPECT_FALSE(ParseAssignmentField("").has_value());
  EXPECT_FALSE(ParseAssignmentField("no-separators").has_value());
  EXPECT_FALSE(ParseAssignmentField("$0:1").has_value());
  EXPECT_FALSE(ParseAssignmentField("exp$:1").has_value());
  EXPECT_FALSE(ParseAssignmentField("exp$0").has_value());
}

TEST(ParseFieldTest, TimestampFieldWithTrailing) {
  const auto field = ParseTimestampField("exp$0:1380888455:8035200:a:b");
  ASSERT_TRUE(field.has_value());
  EXPECT_EQ(field->experiment_id, "exp");
  EXPECT_EQ(field->tag, "0");
  EXPECT_EQ(field->timestamp, "1380888455");
  EXPECT_EQ(field->ttl, "8035200");
  EXPECT_EQ(field->trailing, "a:b");
  EXPECT_EQ(FormatTimestampField(*field), "exp$0:1380888455:8035200:a:b");
}

TEST(ParseFieldTest, TimestampFieldRejectsMalformed) {
  EXPECT_FALSE(ParseTimestampField("exp$0:1380888455").has_value());
  EXPECT_FALSE(ParseTimestampField("exp$0::8035200").has_value());
  EXPECT_FALSE(ParseTimestampField("exp$0:1380888455:").has_value());
  EXPECT_FALSE(ParseTimestampField("exp0:1:2").has_value());
}

TEST(DecodeAssignmentTest, FindsExperiment) {
  EXPECT_THAT(DecodeAssignment(kTwoExperiments, "ft-6uzLPSelrFQsPgouIkD"),
              Optional(2));
  EXPECT_THAT(DecodeAssignment(kTwoExperiments, "ft-5xaLPSturFXCPgoFrKg"),
              Optional(1));
}

TEST(DecodeAssignmentTest, UnknownExperimentIsAbsent) {
  EXPECT_EQ(DecodeAssignment(kTwoExperiments, "ft-unknown"), std::nullopt);
}

TEST(DecodeAssignmentTest, NoPriorCookie) {
  EXPECT_EQ(DecodeAssignment("", "exp"), std::nullopt);
  EXPECT_EQ(DecodeAssignment("159991919", "exp"), std::nullopt);
  EXPECT_EQ(DecodeAssignment("exp$0:1", "exp"), std::nullopt);
}

TEST(DecodeAssignmentTest, DomainHashFieldIsIgnored) {
  EXPECT_EQ(DecodeAssignment("exp$0:1.other$0:2", "exp"), std::nullopt);
}

TEST(DecodeAssignmentTest, LegacyMultiValueUsesFirstSegment) {
  EXPECT_THAT(DecodeAssignment("1.exp$0:3-4-5", "exp"), Optional(3));
}

TEST(DecodeAssignmentTest, NonNumericVariationDecodesToZero) {
  EXPECT_THAT(DecodeAssignment("1.exp$0:abc", "exp"), Optional(0));
  EXPECT_THAT(DecodeAssignment("1.exp$0:", "exp"), Optional(0));
  EXPECT_THAT(DecodeAssignment("1.exp$0:7abc", "exp"), Optional(7));
}

TEST(DecodeAssignmentTest, AnyTagIsAccepted) {
  EXPECT_THAT(DecodeAssignment("1.exp$x$y:4", "exp"), Optional(4));
}

TEST(DecodeAssignmentTest, MalformedFieldsAreSkipped) {
  EXPECT_THAT(DecodeAssignment("1..garbage.exp$0.exp$0:6", "exp"),
              Optional(6));
}

TEST(DecodeAssignmentTest, FirstMatchWins) {
  EXPECT_THAT(DecodeAssignment("1.exp$0:1.exp$0:2", "exp"), Optional(1));
}

TEST(UpdateAssignmentCookieTest, CreatesValueFromScratch) {
  EXPECT_EQ(UpdateAssignmentCookie("", "myExp", 3, "example.com"),
            absl::StrCat(kExampleHash, ".myExp$0:3"));
  EXPECT_EQ(UpdateAssignmentCookie("garbage", "myExp", 3, "example.com"),
            absl::StrCat(kExampleHash, ".myExp$0:3"));
}

TEST(UpdateAssignmentCookieTest, ReusesDomainHashAndAppends) {
  EXPECT_EQ(UpdateAssignmentCookie(kTwoExperiments, "myExp", 1,
                                   "example.com"),
            absl::StrCat(kTwoExperiments, ".myExp$0:1"));
}

TEST(UpdateAssignmentCookieTest, ReplacesInPlaceKeepingTag) {
  EXPECT_EQ(UpdateAssignmentCookie("123.a$7:1-2.b$0:2", "a", 5, "example.com"),
            "123.a$7:5.b$0:2");
}

TEST(UpdateAssignmentCookieTest, RepeatedUpdatesKeepOneField) {
  std::string cookie = UpdateAssignmentCookie("", "exp", 1, "example.com");
  cookie = UpdateAssignmentCookie(cookie, "exp", 2, "example.com");
  cookie = UpdateAssignmentCookie(cookie, "exp", 3, "example.com");
  EXPECT_EQ(cookie, absl::StrCat(kExampleHash, ".exp$0:3"));
  std::vector<absl::string_view> fields = absl::StrSplit(cookie, '.');
  EXPECT_EQ(fields.size(), 2u);
  EXPECT_THAT(DecodeAssignment(cookie, "exp"), Optional(3));
}

TEST(UpdateAssignmentCookieTest, KeepsMalformedFieldsVerbatim) {
  EXPECT_EQ(UpdateAssignmentCookie("123.garbage.a$0:1", "b", 4, "example.com"),
            "123.garbage.a$0:1.b$0:4");
}

TEST(UpdateAssignmentCookieTest, NegativeVariation) {
  const std::string cookie =
      UpdateAssignmentCookie("", "exp", -2, "example.com");
  EXPECT_EQ(cookie, absl::StrCat(kExampleHash, ".exp$0:-2"));
}

TEST(UpdateAssignmentCookieTest, DecodesWhatWasEncoded) {
  for (int variation : {1, 2, 17}) {
    const std::string cookie =
        UpdateAssignmentCookie("", "exp", variation, "example.com");
    EXPECT_THAT(DecodeAssignment(cookie, "exp"), Optional(variation));
  }
}

TEST(UpdateTimestampCookieTest, CreatesValueFromScratch) {
  EXPECT_EQ(UpdateTimestampCookie("", "myExp", 1000, "example.com"),
            absl::StrCat(kExampleHash, ".myExp$0:1000:8035200"));
}

TEST(UpdateTimestampCookieTest, AppendsNewExperiment) {
  EXPECT_EQ(UpdateTimestampCookie("159991919.a$0:1380888455:8035200", "b",
                                  1380888500, "example.com"),
            "159991919.a$0:1380888455:8035200.b$0:1380888500:8035200");
}

TEST(UpdateTimestampCookieTest, RefreshesTimestampOnly) {
  EXPECT_EQ(UpdateTimestampCookie("5.e$1:100:200:zz.f$0:1:2", "e", 300,
                                  "example.com"),
            "5.e$1:300:200:zz.f$0:1:2");
}

TEST(UpdateTimestampCookieTest, TrailingZeroIsCarried) {
  EXPECT_EQ(UpdateTimestampCookie("5.e$0:100:200:0", "e", 300, "example.com"),
            "5.e$0:300:200:0");
}

TEST(UpdateTimestampCookieTest, MalformedFieldForSameIdIsNotReused) {
  EXPECT_EQ(UpdateTimestampCookie("5.e$0:100", "e", 300, "example.com"),
            "5.e$0:100.e$0:300:8035200");
}

TEST(UpdateTimestampCookieTest, EveryMatchingFieldIsRefreshed) {
  EXPECT_EQ(UpdateTimestampCookie("5.e$0:1:2.e$0:3:4", "e", 9, "example.com"),
            "5.e$0:9:2.e$0:9:4");
}

}  // namespace
}  // namespace content_experiments
