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

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/functional/function_ref.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"

namespace content_experiments {

// Caches raw API responses on disk, one file per experiment:
// <dir>/gacx-<url-encoded experiment id>.cache. A file is fresh while
// now <= mtime + ttl.
//
// Lookups for the same key are serialized, so within one process a key is
// fetched at most once per TTL window. Distinct keys do not block each other.
class ResponseCache {
 public:
  using Clock = std::function<absl::Time()>;

  ResponseCache(std::string dir, absl::Duration ttl, Clock clock = absl::Now);

  ResponseCache(const ResponseCache&) = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  // Returns the cached response for `key` when fresh, otherwise calls `fetch`
  // and stores a non-empty result. Errors from `fetch` are returned as is.
  absl::StatusOr<std::string> GetOrFetch(
      absl::string_view key,
      absl::FunctionRef<absl::StatusOr<std::string>()> fetch);

  std::string PathFor(absl::string_view key) const;

 private:
  absl::Mutex* KeyMutex(absl::string_view key);

  const std::string dir_;
  const absl::Duration ttl_;
  const Clock clock_;

  absl::Mutex mu_;
  absl::flat_hash_map<std::string, std::unique_ptr<absl::Mutex>> key_mutexes_
      ABSL_GUARDED_BY(mu_);
};

// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string RawUrlEncode(absl::string_view input);

}  // namespace content_experiments
