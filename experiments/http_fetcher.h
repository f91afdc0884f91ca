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

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace content_experiments {

// Retrieves a document over HTTP. Any failure, including an HTTP error
// status, is reported with ErrorKind::kDataProvider.
class HttpFetcher {
 public:
  virtual ~HttpFetcher() = default;

  virtual absl::StatusOr<std::string> Get(const std::string& url) = 0;
};

struct ParsedUrl {
  bool tls = false;
  std::string host;
  std::string port;
  // Path and query, always starting with '/'.
  std::string target;
};

// Accepts absolute http:// and https:// URLs.
absl::StatusOr<ParsedUrl> ParseHttpUrl(absl::string_view url);

// Resolves a Location header against the URL that produced it.
std::string ResolveRedirect(const ParsedUrl& base, absl::string_view location);

// Blocking HTTP/1.1 client built on Boost.Beast. Each Get() runs on its own
// io_context, so one instance may be shared between threads.
class BeastHttpFetcher : public HttpFetcher {
 public:
  static constexpr int kMaxRedirects = 5;

  // `connect_timeout` bounds name resolution plus connection setup.
  // `timeout` bounds each request as a whole.
  BeastHttpFetcher(absl::Duration connect_timeout, absl::Duration timeout)
      : connect_timeout_(connect_timeout), timeout_(timeout) {}

  absl::StatusOr<std::string> Get(const std::string& url) override;

 private:
  const absl::Duration connect_timeout_;
  const absl::Duration timeout_;
};

}  // namespace content_experiments
