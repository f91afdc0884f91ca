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

#include "experiments/experiment_config.h"

#include "experiments/errors.h"
#include "gtest/gtest.h"

namespace content_experiments {
namespace {

TEST(ExperimentConfigTest, Defaults) {
  const ExperimentConfig config;
  EXPECT_EQ(config.api_url, "http://www.google-analytics.com/cx/api.js");
  EXPECT_EQ(config.connect_timeout, absl::Seconds(2));
  EXPECT_EQ(config.timeout, absl::Seconds(2));
  EXPECT_EQ(config.domain_name, "auto");
  EXPECT_EQ(config.cookie_path, "/");
  EXPECT_EQ(config.cookie_expiration, absl::Seconds(48211200));
  EXPECT_TRUE(config.cache_dir.empty());
  EXPECT_EQ(config.cache_ttl, absl::Seconds(60));
}

TEST(ExperimentConfigTest, SettersNormalize) {
  ExperimentConfig config;
  SetDomainName(&config, "WWW.Example.COM");
  SetCacheDir(&config, "/var/cache/experiments//");
  EXPECT_EQ(config.domain_name, "www.example.com");
  EXPECT_EQ(config.cache_dir, "/var/cache/experiments");
}

TEST(ExperimentConfigTest, ParsesYaml) {
  auto config = ParseExperimentConfigYaml(R"yaml(
api_url: http://localhost:8000/cx/api.js
connect_timeout_seconds: 1
timeout_seconds: 5
domain_name: Example.com
cookie_path: /shop
cookie_expiration_seconds: 3600
cache_dir: /tmp/gacx/
cache_ttl_seconds: 0
)yaml");
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->api_url, "http://localhost:8000/cx/api.js");
  EXPECT_EQ(config->connect_timeout, absl::Seconds(1));
  EXPECT_EQ(config->timeout, absl::Seconds(5));
  EXPECT_EQ(config->domain_name, "example.com");
  EXPECT_EQ(config->cookie_path, "/shop");
  EXPECT_EQ(config->cookie_expiration, absl::Seconds(3600));
  EXPECT_EQ(config->cache_dir, "/tmp/gacx");
  EXPECT_EQ(config->cache_ttl, absl::ZeroDuration());
}

TEST(ExperimentConfigTest, EmptyYamlKeepsDefaults) {
  auto config = ParseExperimentConfigYaml("");
  ASSERT_TRUE(config.ok()) << config.status();
  EXPECT_EQ(config->domain_name, "auto");
}

TEST(ExperimentConfigTest, RejectsUnknownKey) {
  auto config = ParseExperimentConfigYaml("domain: example.com\n");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(GetErrorKind(config.status()), ErrorKind::kConfiguration);
}

TEST(ExperimentConfigTest, RejectsBadValues) {
  EXPECT_FALSE(ParseExperimentConfigYaml("timeout_seconds: 0\n").ok());
  EXPECT_FALSE(ParseExperimentConfigYaml("cache_ttl_seconds: -1\n").ok());
  EXPECT_FALSE(ParseExperimentConfigYaml("timeout_seconds: soon\n").ok());
  EXPECT_FALSE(ParseExperimentConfigYaml("- a\n- b\n").ok());
  EXPECT_FALSE(ParseExperimentConfigYaml("domain_name: [unclosed\n").ok());
}

TEST(ExperimentConfigTest, MissingFileIsConfigurationError) {
  auto config = LoadExperimentConfigFile("/nonexistent/experiments.yaml");
  ASSERT_FALSE(config.ok());
  EXPECT_EQ(config.status().code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(GetErrorKind(config.status()), ErrorKind::kConfiguration);
}

TEST(ResolveDomainNameTest, AutoUsesHostWithoutPort) {
  const ExperimentConfig config;
  EXPECT_EQ(*ResolveDomainName(config, "Example.com"), "example.com");
  EXPECT_EQ(*ResolveDomainName(config, "example.com:8080"), "example.com");
  EXPECT_EQ(*ResolveDomainName(config, "[::1]:8080"), "[::1]");
  EXPECT_EQ(*ResolveDomainName(config, "[::1]"), "[::1]");
}

TEST(ResolveDomainNameTest, AutoWithoutHostFails) {
  const ExperimentConfig config;
  auto domain = ResolveDomainName(config, std::nullopt);
  ASSERT_FALSE(domain.ok());
  EXPECT_EQ(GetErrorKind(domain.status()), ErrorKind::kConfiguration);
  EXPECT_FALSE(ResolveDomainName(config, "").ok());
}

TEST(ResolveDomainNameTest, ConfiguredNameWins) {
  ExperimentConfig config;
  SetDomainName(&config, "Shop.Example.org");
  EXPECT_EQ(*ResolveDomainName(config, "other.example.com"),
            "shop.example.org");
  EXPECT_EQ(*ResolveDomainName(config, std::nullopt), "shop.example.org");
}

TEST(ResolveDomainNameTest, EmptyConfiguredNameFails) {
  ExperimentConfig config;
  SetDomainName(&config, "");
  auto domain = ResolveDomainName(config, "example.com");
  ASSERT_FALSE(domain.ok());
  EXPECT_EQ(domain.status().code(), absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(GetErrorKind(domain.status()), ErrorKind::kConfiguration);
}

}  // namespace
}  // namespace content_experiments
