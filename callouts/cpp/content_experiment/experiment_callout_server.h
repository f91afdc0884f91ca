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

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/random/random.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "envoy/service/ext_proc/v3/external_processor.pb.h"
#include "experiments/data_provider.h"
#include "experiments/experiment_config.h"
#include "experiments/experiment_session.h"
#include "service/callout_server.h"

using envoy::service::ext_proc::v3::ProcessingRequest;
using envoy::service::ext_proc::v3::ProcessingResponse;

namespace content_experiments {

// Assigns every visitor of one experiment to a variation at the proxy.
//
// The chosen variation is forwarded upstream in a request header and the
// tracking cookies are written back on the response of the same stream.
class ExperimentCalloutServer : public CalloutServer {
 public:
  static constexpr std::string_view kVariationHeader =
      "x-content-experiment-variation";
  static constexpr std::string_view kErrorHeader =
      "x-content-experiment-error";

  struct Options {
    // Uniform draw in [0, 1). Defaults to absl::BitGen.
    std::function<double()> draw;
    std::function<absl::Time()> clock = absl::Now;
  };

  // Set-Cookie values computed on the request, emitted on the response.
  class ExperimentStream : public StreamContext {
   public:
    std::vector<std::string> set_cookies;
  };

  ExperimentCalloutServer(std::string experiment_id, ExperimentConfig config,
                          std::unique_ptr<ExperimentDataProvider> provider);
  ExperimentCalloutServer(std::string experiment_id, ExperimentConfig config,
                          std::unique_ptr<ExperimentDataProvider> provider,
                          Options options);

  std::unique_ptr<StreamContext> NewStreamContext() override;

  void OnRequestHeader(StreamContext* stream, ProcessingRequest* request,
                       ProcessingResponse* response) override;

  void OnResponseHeader(StreamContext* stream, ProcessingRequest* request,
                        ProcessingResponse* response) override;

 private:
  double Draw() ABSL_LOCKS_EXCLUDED(mu_);
  // Runs the session. `domain_name` receives the cookie domain, or stays
  // empty when the request does not determine one.
  absl::StatusOr<VariationDecision> Decide(const HttpHeaders& headers,
                                           absl::Time now,
                                           std::string* domain_name);

  const std::string experiment_id_;
  const ExperimentConfig config_;
  std::unique_ptr<ExperimentDataProvider> provider_;
  ExperimentSession session_;
  Options options_;

  absl::Mutex mu_;
  absl::BitGen bitgen_ ABSL_GUARDED_BY(mu_);
};

}  // namespace content_experiments
