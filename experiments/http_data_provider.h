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

#include <memory>
#include <string>
#include <vector>

#include "experiments/data_provider.h"
#include "experiments/experiment_config.h"
#include "experiments/http_fetcher.h"
#include "experiments/response_cache.h"

namespace content_experiments {

// Fetches experiment weights from the JavaScript experiments API, optionally
// through an on-disk ResponseCache.
class HttpExperimentDataProvider : public ExperimentDataProvider {
 public:
  // `cache` may be null to disable caching.
  HttpExperimentDataProvider(std::string api_url,
                             std::unique_ptr<HttpFetcher> fetcher,
                             std::unique_ptr<ResponseCache> cache);

  // Builds the production provider: a BeastHttpFetcher with the configured
  // timeouts, and a cache when `config.cache_dir` is set.
  static std::unique_ptr<HttpExperimentDataProvider> Create(
      const ExperimentConfig& config);

  absl::StatusOr<std::vector<VariationRecord>> Fetch(
      absl::string_view experiment_id) override;

  std::string ExperimentUrl(absl::string_view experiment_id) const;

 private:
  const std::string api_url_;
  std::unique_ptr<HttpFetcher> fetcher_;
  std::unique_ptr<ResponseCache> cache_;
};

}  // namespace content_experiments
