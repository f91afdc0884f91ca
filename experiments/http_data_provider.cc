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

#include "experiments/http_data_provider.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "experiments/api_response_parser.h"
#include "experiments/errors.h"

namespace content_experiments {

HttpExperimentDataProvider::HttpExperimentDataProvider(
    std::string api_url, std::unique_ptr<HttpFetcher> fetcher,
    std::unique_ptr<ResponseCache> cache)
    : api_url_(std::move(api_url)),
      fetcher_(std::move(fetcher)),
      cache_(std::move(cache)) {}

std::unique_ptr<HttpExperimentDataProvider> HttpExperimentDataProvider::Create(
    const ExperimentConfig& config) {
  std::unique_ptr<ResponseCache> cache;
  if (!config.cache_dir.empty()) {
    LOG(INFO) << "Caching experiment data in " << config.cache_dir << " for "
              << config.cache_ttl;
    cache = std::make_unique<ResponseCache>(config.cache_dir, config.cache_ttl);
  }
  return std::make_unique<HttpExperimentDataProvider>(
      config.api_url,
      std::make_unique<BeastHttpFetcher>(config.connect_timeout,
                                         config.timeout),
      std::move(cache));
}

std::string HttpExperimentDataProvider::ExperimentUrl(
    absl::string_view experiment_id) const {
  return absl::StrCat(api_url_, absl::StrContains(api_url_, '?') ? "&" : "?",
                      "experiment=", RawUrlEncode(experiment_id));
}

absl::StatusOr<std::vector<VariationRecord>> HttpExperimentDataProvider::Fetch(
    absl::string_view experiment_id) {
  const std::string url = ExperimentUrl(experiment_id);
  auto fetch = [&]() { return fetcher_->Get(url); };

  absl::StatusOr<std::string> response =
      cache_ != nullptr ? cache_->GetOrFetch(experiment_id, fetch) : fetch();
  if (!response.ok()) {
    return response.status();
  }
  if (response->empty()) {
    return DataProviderError(
        absl::StatusCode::kUnavailable,
        absl::StrCat("empty experiments API response from ", url));
  }
  return ParseApiResponse(*response, experiment_id);
}

}  // namespace content_experiments
