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

#include "experiments/api_response_parser.h"

#include "absl/strings/str_cat.h"
#include "experiments/errors.h"
#include "google/protobuf/util/json_util.h"
#include "re2/re2.h"

namespace content_experiments {

absl::StatusOr<std::string> ExtractExperimentsJson(absl::string_view response) {
  static const re2::RE2* const kMarker =
      new re2::RE2(R"((\.experiments_\s*=\s*)\{)");

  re2::StringPiece input(response.data(), response.size());
  re2::StringPiece prefix;
  if (!re2::RE2::PartialMatch(input, *kMarker, &prefix)) {
    return DataProviderError(absl::StatusCode::kNotFound,
                             "unable to find experiments in the API response");
  }

  const size_t start = (prefix.data() - response.data()) + prefix.size();
  int depth = 0;
  for (size_t i = start; i < response.size(); ++i) {
    if (response[i] == '{') {
      ++depth;
    } else if (response[i] == '}' && --depth == 0) {
      return std::string(response.substr(start, i - start + 1));
    }
  }
  return DataProviderError(
      absl::StatusCode::kNotFound,
      "unterminated experiments object in the API response");
}

absl::StatusOr<pb::ExperimentsResponse> ParseExperimentsJson(
    absl::string_view json) {
  // The object is keyed by experiment id; wrap it to fit the map field.
  const std::string wrapped = absl::StrCat("{\"experiments\":", json, "}");
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  pb::ExperimentsResponse response;
  const auto status =
      google::protobuf::util::JsonStringToMessage(wrapped, &response, options);
  if (!status.ok()) {
    return DataProviderError(
        absl::StatusCode::kDataLoss,
        absl::StrCat("unable to parse JSON from the API response: ",
                     status.ToString()));
  }
  return response;
}

absl::StatusOr<std::vector<VariationRecord>> ToVariationRecords(
    const pb::ExperimentsResponse& response, absl::string_view experiment_id) {
  const auto it = response.experiments().find(std::string(experiment_id));
  if (it == response.experiments().end()) {
    return DataProviderError(
        absl::StatusCode::kNotFound,
        absl::StrCat("no data for experiment ", experiment_id,
                     " in the API response"));
  }
  const pb::ExperimentEntry& entry = it->second;
  if (!entry.has_data()) {
    if (entry.has_error()) {
      return DataProviderError(
          absl::StatusCode::kAborted,
          absl::StrCat("error from the API: ", entry.error().code(), " - ",
                       entry.error().message()));
    }
    return DataProviderError(
        absl::StatusCode::kNotFound,
        absl::StrCat("no data for experiment ", experiment_id,
                     " in the API response"));
  }

  std::vector<VariationRecord> records;
  records.reserve(entry.data().items_size());
  for (const pb::Variation& item : entry.data().items()) {
    if (!item.has_weight()) {
      continue;
    }
    VariationRecord record;
    if (item.has_id()) {
      record.variation_id = item.id().value();
    }
    record.weight = item.weight().value();
    record.disabled = item.disabled();
    records.push_back(record);
  }
  return records;
}

absl::StatusOr<std::vector<VariationRecord>> ParseApiResponse(
    absl::string_view response, absl::string_view experiment_id) {
  absl::StatusOr<std::string> json = ExtractExperimentsJson(response);
  if (!json.ok()) {
    return json.status();
  }
  absl::StatusOr<pb::ExperimentsResponse> experiments =
      ParseExperimentsJson(*json);
  if (!experiments.ok()) {
    return experiments.status();
  }
  return ToVariationRecords(*experiments, experiment_id);
}

}  // namespace content_experiments
