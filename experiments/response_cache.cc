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

#include "experiments/response_cache.h"

#include <boost/filesystem.hpp>
#include <ctime>
#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "experiments/errors.h"

namespace content_experiments {
namespace {

// Returns the file contents when the file exists and is still fresh.
std::optional<std::string> ReadFresh(const std::string& path,
                                     absl::Duration ttl, absl::Time now) {
  boost::system::error_code ec;
  const std::time_t mtime = boost::filesystem::last_write_time(path, ec);
  if (ec || now > absl::FromTimeT(mtime) + ttl) {
    return std::nullopt;
  }
  std::ifstream file(path, std::ios::binary);
  if (file.fail()) {
    return std::nullopt;
  }
  std::stringstream contents;
  contents << file.rdbuf();
  std::string data = contents.str();
  if (data.empty()) {
    return std::nullopt;
  }
  return data;
}

}  // namespace

std::string RawUrlEncode(absl::string_view input) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(input.size());
  for (const char c : input) {
    if (absl::ascii_isalnum(c) || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(c);
    } else {
      const auto byte = static_cast<unsigned char>(c);
      out.push_back('%');
      out.push_back(kHex[byte >> 4]);
      out.push_back(kHex[byte & 0xf]);
    }
  }
  return out;
}

ResponseCache::ResponseCache(std::string dir, absl::Duration ttl, Clock clock)
    : dir_(std::move(dir)), ttl_(ttl), clock_(std::move(clock)) {}

std::string ResponseCache::PathFor(absl::string_view key) const {
  return absl::StrCat(dir_, "/gacx-", RawUrlEncode(key), ".cache");
}

absl::Mutex* ResponseCache::KeyMutex(absl::string_view key) {
  absl::MutexLock lock(&mu_);
  std::unique_ptr<absl::Mutex>& mutex = key_mutexes_[key];
  if (mutex == nullptr) {
    mutex = std::make_unique<absl::Mutex>();
  }
  return mutex.get();
}

absl::StatusOr<std::string> ResponseCache::GetOrFetch(
    absl::string_view key,
    absl::FunctionRef<absl::StatusOr<std::string>()> fetch) {
  absl::MutexLock key_lock(KeyMutex(key));

  const std::string path = PathFor(key);
  if (std::optional<std::string> cached = ReadFresh(path, ttl_, clock_())) {
    return *std::move(cached);
  }

  absl::StatusOr<std::string> response = fetch();
  if (!response.ok() || response->empty()) {
    return response;
  }

  boost::system::error_code ec;
  if (!boost::filesystem::is_directory(dir_, ec)) {
    return DataProviderError(
        absl::StatusCode::kUnavailable,
        absl::StrCat("cache directory \"", dir_, "\" does not exist"));
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  file << *response;
  file.close();
  if (file.fail()) {
    return DataProviderError(
        absl::StatusCode::kUnavailable,
        absl::StrCat("cache directory \"", dir_, "\" is not writable"));
  }
  LOG(INFO) << "Cached experiment data for " << key << " in " << path;
  return response;
}

}  // namespace content_experiments
