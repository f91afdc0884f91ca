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


#include "content_experiment/experiment_callout_server.h"

#include <optional>
#include <utility>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "experiments/cookie_codec.h"
#include "experiments/cookies.h"

namespace content_experiments {

ExperimentCalloutServer::ExperimentCalloutServer(
    std::string experiment_id, ExperimentConfig config,
    std::unique_ptr<ExperimentDataProvider> provider)
    : ExperimentCalloutServer(std::move(experiment_id), std::move(config),
                              std::move(provider), Options()) {}

ExperimentCalloutServer::ExperimentCalloutServer(
    std::string experiment_id, ExperimentConfig config,
    std::unique_ptr<ExperimentDataProvider> provider, Options options)
    : experiment_id_(std::move(experiment_id)),
      config_(std::move(config)),
      provider_(std::move(provider)),
      session_(provider_.get()),
      options_(std::move(options)) {}

std::unique_ptr<CalloutServer::StreamContext>
ExperimentCalloutServer::NewStreamContext() {
  return std::make_unique<ExperimentStream>();
}

double ExperimentCalloutServer::Draw() {
  if (options_.draw) {
    return options_.draw();
  }
  absl::MutexLock lock(&mu_);
  return absl::Uniform<double>(bitgen_, 0.0, 1.0);
}

absl::StatusOr<VariationDecision> ExperimentCalloutServer::Decide(
    const HttpHeaders& headers, absl::Time now, std::string* domain_name) {
  std::optional<std::string> host = GetHeaderValue(headers, ":authority");
  if (!host.has_value()) {
    host = GetHeaderValue(headers, "host");
  }
  std::optional<absl::string_view> host_view;
  if (host.has_value()) {
    host_view = *host;
  }
  // The domain only matters when cookies are rewritten; a returning visitor
  // is served without one.
  absl::StatusOr<std::string> domain = ResolveDomainName(config_, host_view);
  if (domain.ok()) {
    *domain_name = *domain;
  }

  const std::string cookie_header =
      GetHeaderValue(headers, "cookie").value_or("");
  absl::StatusOr<VariationDecision> decision = session_.ChooseVariation(
      experiment_id_,
      FindCookie(cookie_header, kAssignmentCookieName).value_or(""),
      FindCookie(cookie_header, kTimestampCookieName).value_or(""), Draw(),
      absl::ToUnixSeconds(now), *domain_name);
  if (!decision.ok() && !domain.ok()) {
    return domain.status();
  }
  return decision;
}

void ExperimentCalloutServer::OnRequestHeader(StreamContext* stream,
                                              ProcessingRequest* request,
                                              ProcessingResponse* response) {
  const absl::Time now = options_.clock();
  std::string domain_name;
  absl::StatusOr<VariationDecision> decision =
      Decide(request->request_headers(), now, &domain_name);
  if (!decision.ok()) {
    LOG(ERROR) << "Could not choose a variation for experiment "
               << experiment_id_ << ": " << decision.status();
    RemoveRequestHeader(response, kVariationHeader);
    ReplaceRequestHeader(response, kErrorHeader,
                         absl::StatusCodeToString(decision.status().code()));
    return;
  }

  RemoveRequestHeader(response, kErrorHeader);
  ReplaceRequestHeader(response, kVariationHeader,
                       absl::StrCat(decision->variation));
  auto* experiment_stream = dynamic_cast<ExperimentStream*>(stream);
  if (!decision->cookies_updated || experiment_stream == nullptr) {
    return;
  }
  for (const Cookie& cookie :
       BuildExperimentCookies(config_, domain_name, decision->cookies, now)) {
    experiment_stream->set_cookies.push_back(FormatSetCookie(cookie, now));
  }
}

void ExperimentCalloutServer::OnResponseHeader(StreamContext* stream,
                                               ProcessingRequest* request,
                                               ProcessingResponse* response) {
  response->mutable_response_headers();
  auto* experiment_stream = dynamic_cast<ExperimentStream*>(stream);
  if (experiment_stream == nullptr) {
    return;
  }
  for (const std::string& value : experiment_stream->set_cookies) {
    AddResponseHeader(response, "set-cookie", value);
  }
  experiment_stream->set_cookies.clear();
}

}  // namespace content_experiments
