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

#include "experiments/http_fetcher.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <algorithm>
#include <chrono>
#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "experiments/errors.h"

namespace content_experiments {
namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

using Response = http::response<http::string_body>;

absl::Status TransportError(absl::string_view what, const ParsedUrl& url,
                            const beast::error_code& ec) {
  return DataProviderError(
      absl::StatusCode::kUnavailable,
      absl::StrCat(what, " ", url.host, ":", url.port, " failed: ",
                   ec.message()));
}

// Drives the io_context until every queued operation has completed. Every
// operation started on a beast::tcp_stream carries its own expiry.
void RunToCompletion(asio::io_context& ioc) {
  ioc.restart();
  ioc.run();
}

absl::StatusOr<tcp::resolver::results_type> Resolve(
    asio::io_context& ioc, const ParsedUrl& url, absl::Duration limit) {
  tcp::resolver resolver(ioc);
  beast::error_code ec = asio::error::would_block;
  tcp::resolver::results_type results;
  resolver.async_resolve(
      url.host, url.port,
      [&](const beast::error_code& e, tcp::resolver::results_type r) {
        ec = e;
        results = std::move(r);
      });
  ioc.restart();
  ioc.run_for(absl::ToChronoMilliseconds(limit));
  if (ec == asio::error::would_block) {
    resolver.cancel();
    RunToCompletion(ioc);
    return TransportError("resolving", url, beast::error::timeout);
  }
  if (ec) {
    return TransportError("resolving", url, ec);
  }
  return results;
}

// Sends `request` and reads the response on an established stream.
template <typename Stream>
absl::StatusOr<Response> Exchange(
    asio::io_context& ioc, Stream& stream, const ParsedUrl& url,
    const http::request<http::empty_body>& request,
    std::chrono::steady_clock::time_point deadline) {
  beast::error_code ec;
  beast::get_lowest_layer(stream).expires_at(deadline);
  http::async_write(stream, request,
                    [&](const beast::error_code& e, size_t) { ec = e; });
  RunToCompletion(ioc);
  if (ec) {
    return TransportError("writing to", url, ec);
  }

  beast::flat_buffer buffer;
  Response response;
  beast::get_lowest_layer(stream).expires_at(deadline);
  http::async_read(stream, buffer, response,
                   [&](const beast::error_code& e, size_t) { ec = e; });
  RunToCompletion(ioc);
  if (ec) {
    return TransportError("reading from", url, ec);
  }
  return response;
}

}  // namespace

absl::StatusOr<ParsedUrl> ParseHttpUrl(absl::string_view url) {
  ParsedUrl parsed;
  const std::string lower = absl::AsciiStrToLower(url.substr(0, 8));
  if (absl::StartsWith(lower, "https://")) {
    parsed.tls = true;
    url.remove_prefix(8);
  } else if (absl::StartsWith(lower, "http://")) {
    url.remove_prefix(7);
  } else {
    return ConfigurationError(absl::StatusCode::kInvalidArgument,
                              absl::StrCat("unsupported URL: ", url));
  }

  const size_t authority_end = url.find_first_of("/?#");
  absl::string_view authority = url.substr(0, authority_end);
  absl::string_view rest = authority_end == absl::string_view::npos
                               ? absl::string_view()
                               : url.substr(authority_end);
  rest = rest.substr(0, rest.find('#'));
  parsed.target = absl::StartsWith(rest, "/") ? std::string(rest)
                                              : absl::StrCat("/", rest);

  const size_t colon = authority.rfind(':');
  if (colon != absl::string_view::npos &&
      authority.find(']', colon) == absl::string_view::npos) {
    parsed.port = std::string(authority.substr(colon + 1));
    authority = authority.substr(0, colon);
  } else {
    parsed.port = parsed.tls ? "443" : "80";
  }
  if (absl::ConsumePrefix(&authority, "[")) {
    absl::ConsumeSuffix(&authority, "]");
  }
  parsed.host = std::string(authority);
  if (parsed.host.empty() || parsed.port.empty()) {
    return ConfigurationError(absl::StatusCode::kInvalidArgument,
                              absl::StrCat("invalid URL: ", url));
  }
  return parsed;
}

std::string ResolveRedirect(const ParsedUrl& base, absl::string_view location) {
  const absl::string_view scheme = base.tls ? "https:" : "http:";
  if (absl::StrContains(location, "://")) {
    return std::string(location);
  }
  if (absl::StartsWith(location, "//")) {
    return absl::StrCat(scheme, location);
  }
  const bool default_port = base.port == (base.tls ? "443" : "80");
  const std::string host = absl::StrContains(base.host, ':')
                               ? absl::StrCat("[", base.host, "]")
                               : base.host;
  const std::string origin =
      default_port ? absl::StrCat(scheme, "//", host)
                   : absl::StrCat(scheme, "//", host, ":", base.port);
  if (absl::StartsWith(location, "/")) {
    return absl::StrCat(origin, location);
  }
  const absl::string_view path = absl::string_view(base.target).substr(
      0, base.target.find_first_of("?"));
  return absl::StrCat(origin, path.substr(0, path.rfind('/') + 1), location);
}

absl::StatusOr<std::string> BeastHttpFetcher::Get(const std::string& url) {
  std::string current = url;
  for (int redirects = 0; redirects <= kMaxRedirects; ++redirects) {
    absl::StatusOr<ParsedUrl> parsed = ParseHttpUrl(current);
    if (!parsed.ok()) {
      if (redirects == 0) {
        return parsed.status();
      }
      // The Location header came from the remote server.
      return DataProviderError(
          absl::StatusCode::kUnavailable,
          absl::StrCat("invalid redirect from ", url, ": ",
                       parsed.status().message()));
    }

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + absl::ToChronoMilliseconds(timeout_);
    const auto connect_deadline = std::min(
        deadline, start + absl::ToChronoMilliseconds(connect_timeout_));

    asio::io_context ioc;
    absl::StatusOr<tcp::resolver::results_type> endpoints =
        Resolve(ioc, *parsed, connect_timeout_);
    if (!endpoints.ok()) {
      return endpoints.status();
    }

    http::request<http::empty_body> request{http::verb::get, parsed->target,
                                            11};
    request.set(http::field::host, parsed->host);

    beast::error_code ec;
    absl::StatusOr<Response> response;
    if (parsed->tls) {
      ssl::context context(ssl::context::tls_client);
      context.set_default_verify_paths(ec);
      if (ec) {
        return TransportError("loading CA certificates for", *parsed, ec);
      }
      beast::ssl_stream<beast::tcp_stream> stream(ioc, context);
      stream.set_verify_mode(ssl::verify_peer);
      stream.set_verify_callback(ssl::host_name_verification(parsed->host));
      if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                    parsed->host.c_str())) {
        return TransportError(
            "setting SNI for", *parsed,
            beast::error_code(static_cast<int>(::ERR_get_error()),
                              asio::error::get_ssl_category()));
      }

      beast::get_lowest_layer(stream).expires_at(connect_deadline);
      beast::get_lowest_layer(stream).async_connect(
          *endpoints,
          [&](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
      RunToCompletion(ioc);
      if (ec) {
        return TransportError("connecting to", *parsed, ec);
      }
      beast::get_lowest_layer(stream).expires_at(deadline);
      stream.async_handshake(ssl::stream_base::client,
                             [&](const beast::error_code& e) { ec = e; });
      RunToCompletion(ioc);
      if (ec) {
        return TransportError("TLS handshake with", *parsed, ec);
      }
      response = Exchange(ioc, stream, *parsed, request, deadline);
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_at(connect_deadline);
      stream.async_connect(
          *endpoints,
          [&](const beast::error_code& e, const tcp::endpoint&) { ec = e; });
      RunToCompletion(ioc);
      if (ec) {
        return TransportError("connecting to", *parsed, ec);
      }
      response = Exchange(ioc, stream, *parsed, request, deadline);
    }
    if (!response.ok()) {
      return response.status();
    }

    const unsigned status = response->result_int();
    if (status >= 300 && status < 400) {
      const auto location = response->find(http::field::location);
      if (location == response->end()) {
        return DataProviderError(
            absl::StatusCode::kUnavailable,
            absl::StrCat("HTTP ", status, " without Location from ", current));
      }
      current = ResolveRedirect(
          *parsed, absl::string_view(location->value().data(),
                                     location->value().size()));
      LOG(INFO) << "Following redirect to " << current;
      continue;
    }
    if (status >= 400) {
      return DataProviderError(
          absl::StatusCode::kUnavailable,
          absl::StrCat("HTTP ", status, " from ", current));
    }
    return std::move(response->body());
  }
  return DataProviderError(absl::StatusCode::kUnavailable,
                           absl::StrCat("too many redirects fetching ", url));
}

}  // namespace content_experiments
