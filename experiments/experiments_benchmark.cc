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

#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "benchmark/benchmark.h"
#include "experiments/cookie_codec.h"
#include "experiments/hash.h"
#include "experiments/variation.h"

namespace content_experiments {
namespace {

// An assignment cookie holding `n` experiments, the target being last.
std::string AssignmentCookie(int n) {
  std::string cookie = "159991919";
  for (int i = 0; i < n; ++i) {
    absl::StrAppend(&cookie, ".exp-", i, "$0:", i % 3);
  }
  return cookie;
}

static void BM_DomainHash(benchmark::State& state) {
  for (auto _ : state) {
    benchmark::DoNotOptimize(DomainHash("www.example.com"));
  }
}
BENCHMARK(BM_DomainHash);

static void BM_DecodeAssignment(benchmark::State& state) {
  const int n = state.range(0);
  const std::string cookie = AssignmentCookie(n);
  const std::string target = absl::StrCat("exp-", n - 1);
  for (auto _ : state) {
    benchmark::DoNotOptimize(DecodeAssignment(cookie, target));
  }
}
BENCHMARK(BM_DecodeAssignment)->Arg(1)->Arg(8)->Arg(32);

static void BM_UpdateAssignmentCookie(benchmark::State& state) {
  const int n = state.range(0);
  const std::string cookie = AssignmentCookie(n);
  const std::string target = absl::StrCat("exp-", n - 1);
  for (auto _ : state) {
    benchmark::DoNotOptimize(
        UpdateAssignmentCookie(cookie, target, 2, "www.example.com"));
  }
}
BENCHMARK(BM_UpdateAssignmentCookie)->Arg(1)->Arg(8)->Arg(32);

static void BM_SelectVariation(benchmark::State& state) {
  std::vector<VariationRecord> records(state.range(0));
  for (size_t i = 0; i < records.size(); ++i) {
    records[i].variation_id = static_cast<int>(i);
    records[i].weight = 1.0 / records.size();
  }
  for (auto _ : state) {
    benchmark::DoNotOptimize(SelectVariation(records, 0.999));
  }
}
BENCHMARK(BM_SelectVariation)->Arg(2)->Arg(10);

}  // namespace
}  // namespace content_experiments

BENCHMARK_MAIN();
