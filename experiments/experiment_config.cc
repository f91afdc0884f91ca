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

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <sstream>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "experiments/errors.h"

namespace content_experiments {
namespace {

std::optional<std::string> GetStringValue(const YAML::Node& node) {
  if (!node.IsDefined() || node.IsNull()) {
    return std::nullopt;
  }
  return node.as<std::string>();
}

std::optional<int64_t> GetInt64Value(const YAML::Node& node) {
  if (!node.IsDefined() || node.IsNull()) {
    return std::nullopt;
  }
  return node.as<int64_t>();
}

absl::Status InvalidConfig(absl::string_view message) {
  return ConfigurationError(absl::StatusCode::kInvalidArgument, message);
}

// Reads a whole number of seconds. Zero is accepted only when `allow_zero`.
absl::Status ConvertSeconds(const YAML::Node& node, absl::string_view key,
                            bool allow_zero, absl::Duration* out) {
  const std::optional<int64_t> seconds = GetInt64Value(node);
  if (!seconds.has_value()) {
    return absl::OkStatus();
  }
  if (*seconds < 0 || (*seconds == 0 && !allow_zero)) {
    return InvalidConfig(absl::StrCat(key, " out of range: ", *seconds));
  }
  *out = absl::Seconds(*seconds);
  return absl::OkStatus();
}

absl::Status ConvertConfig(const YAML::Node& yaml, ExperimentConfig* config) {
  if (!yaml.IsMap()) {
    return InvalidConfig("experiment config must be a YAML map");
  }
  for (const auto& entry : yaml) {
    const std::string key = entry.first.as<std::string>();
    const YAML::Node& value = entry.second;
    absl::Status status;
    if (key == "api_url") {
      config->api_url = GetStringValue(value).value_or(config->api_url);
    } else if (key == "connect_timeout_seconds") {
      status = ConvertSeconds(value, key, false, &config->connect_timeout);
    } else if (key == "timeout_seconds") {
      status = ConvertSeconds(value, key, false, &config->timeout);
    } else if (key == "domain_name") {
      SetDomainName(config, GetStringValue(value).value_or(""));
    } else if (key == "cookie_path") {
      config->cookie_path = GetStringValue(value).value_or(config->cookie_path);
    } else if (key == "cookie_expiration_seconds") {
      status = ConvertSeconds(value, key, true, &config->cookie_expiration);
    } else if (key == "cache_dir") {
      SetCacheDir(config, GetStringValue(value).value_or(""));
    } else if (key == "cache_ttl_seconds") {
      status = ConvertSeconds(value, key, true, &config->cache_ttl);
    } else {
      status =
          InvalidConfig(absl::StrCat("unknown experiment config key: ", key));
    }
    if (!status.ok()) return status;
  }
  return absl::OkStatus();
}

}  // namespace

void SetDomainName(ExperimentConfig* config, absl::string_view domain_name) {
  config->domain_name = absl::AsciiStrToLower(domain_name);
}

void SetCacheDir(ExperimentConfig* config, absl::string_view cache_dir) {
  while (absl::ConsumeSuffix(&cache_dir, "/")) {
  }
  config->cache_dir = std::string(cache_dir);
}

absl::StatusOr<ExperimentConfig> ParseExperimentConfigYaml(
    const std::string& yaml) {
  ExperimentConfig config;
  try {
    const YAML::Node root = YAML::Load(yaml);
    if (!root.IsDefined() || root.IsNull()) {
      return config;
    }
    if (absl::Status status = ConvertConfig(root, &config); !status.ok()) {
      return status;
    }
  } catch (const YAML::Exception& e) {
    return InvalidConfig(absl::StrCat("YAML parsing error: ", e.what()));
  }
  return config;
}

absl::StatusOr<ExperimentConfig> LoadExperimentConfigFile(
    const std::string& path) {
  std::ifstream file(path);
  if (file.fail()) {
    return ConfigurationError(
        absl::StatusCode::kNotFound,
        absl::StrCat("failed to open experiment config: ", path));
  }
  std::stringstream contents;
  contents << file.rdbuf();
  return ParseExperimentConfigYaml(contents.str());
}

absl::StatusOr<std::string> ResolveDomainName(
    const ExperimentConfig& config, std::optional<absl::string_view> host) {
  if (config.domain_name == kAutoDomainName) {
    if (!host.has_value() || host->empty()) {
      return ConfigurationError(
          "unable to determine the domain name: the request carries no host");
    }
    absl::string_view name = *host;
    // Drop a port, leaving bracketed IPv6 literals alone.
    const size_t colon = name.rfind(':');
    if (colon != absl::string_view::npos &&
        name.find(']', colon) == absl::string_view::npos) {
      name = name.substr(0, colon);
    }
    return absl::AsciiStrToLower(name);
  }
  if (config.domain_name.empty()) {
    return ConfigurationError(
        "unable to determine the domain name: none is configured");
  }
  return config.domain_name;
}

}  // namespace content_experiments
