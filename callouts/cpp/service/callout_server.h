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

#ifndef CONTENT_EXPERIMENTS_CALLOUT_SERVER_H
#define CONTENT_EXPERIMENTS_CALLOUT_SERVER_H

#include <grpcpp/grpcpp.h>
#include <grpcpp/server_builder.h>
#include <grpcpp/server_context.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "envoy/service/ext_proc/v3/external_processor.grpc.pb.h"
#include "envoy/service/ext_proc/v3/external_processor.pb.h"

using envoy::config::core::v3::HeaderValue;
using envoy::config::core::v3::HeaderValueOption;
using envoy::service::ext_proc::v3::ExternalProcessor;
using envoy::service::ext_proc::v3::HeaderMutation;
using envoy::service::ext_proc::v3::HttpHeaders;
using envoy::service::ext_proc::v3::ProcessingRequest;
using envoy::service::ext_proc::v3::ProcessingResponse;

/**
 * @class CalloutServer
 * @brief Base class for Envoy ext_proc callouts that work on HTTP headers
 *
 * Provides header mutation helpers, per-stream state and gRPC server setup.
 */
class CalloutServer : public ExternalProcessor::Service {
 public:
  /**
   * @brief Listener settings for RunServers()
   */
  struct ServerConfig {
    std::string secure_address;
    std::string insecure_address;
    std::string key_path;
    std::string cert_path;
    bool enable_insecure = false;
  };

  /**
   * @brief Scratch space shared by the handlers of one HTTP exchange
   *
   * Created by NewStreamContext() when an ext_proc stream opens and destroyed
   * when it closes.
   */
  class StreamContext {
   public:
    virtual ~StreamContext() = default;
  };

  static ServerConfig DefaultConfig() {
    ServerConfig config;
    config.secure_address = "0.0.0.0:443";
    config.insecure_address = "0.0.0.0:8080";
    config.key_path = "ssl_creds/privatekey.pem";
    config.cert_path = "ssl_creds/chain.pem";
    return config;
  }

  /**
   * @brief Returns the value of a request or response header
   * @param headers Headers received from Envoy
   * @param key Lower-case header name
   * @return The value, preferring raw_value when Envoy sends one
   */
  static std::optional<std::string> GetHeaderValue(const HttpHeaders& headers,
                                                   std::string_view key) {
    for (const HeaderValue& header : headers.headers().headers()) {
      if (header.key() == key) {
        return header.raw_value().empty() ? header.value()
                                          : header.raw_value();
      }
    }
    return std::nullopt;
  }

  /**
   * @brief Replaces or adds a header in the HTTP request
   * @param response The ProcessingResponse to modify
   * @param key Header name to replace
   * @param value New header value
   */
  static void ReplaceRequestHeader(ProcessingResponse* response,
                                   std::string_view key,
                                   std::string_view value) {
    HeaderValueOption* new_header_option = response->mutable_request_headers()
                                               ->mutable_response()
                                               ->mutable_header_mutation()
                                               ->add_set_headers();
    new_header_option->set_append_action(
        HeaderValueOption::OVERWRITE_IF_EXISTS_OR_ADD);
    HeaderValue* new_header = new_header_option->mutable_header();
    new_header->set_key(std::string(key));
    new_header->set_value(std::string(value));
  }

  /**
   * @brief Removes a header from the HTTP request
   * @param response The ProcessingResponse to modify
   * @param header_name Name of the header to remove
   */
  static void RemoveRequestHeader(ProcessingResponse* response,
                                  std::string_view header_name) {
    response->mutable_request_headers()
        ->mutable_response()
        ->mutable_header_mutation()
        ->add_remove_headers(std::string(header_name));
  }

  /**
   * @brief Adds a header to the HTTP response, keeping existing ones
   * @param response The ProcessingResponse to modify
   * @param key Header name to add
   * @param value Header value to add
   */
  static void AddResponseHeader(ProcessingResponse* response,
                                std::string_view key, std::string_view value) {
    HeaderValue* new_header = response->mutable_response_headers()
                                  ->mutable_response()
                                  ->mutable_header_mutation()
                                  ->add_set_headers()
                                  ->mutable_header();
    new_header->set_key(std::string(key));
    new_header->set_value(std::string(value));
  }

  /**
   * @brief Creates SSL credentials for secure server communication
   * @param key_path Path to private key file
   * @param cert_path Path to certificate file
   * @return Optional containing server credentials or nullopt on error
   */
  static std::optional<std::shared_ptr<grpc::ServerCredentials>>
  CreateSecureServerCredentials(std::string_view key_path,
                                std::string_view cert_path) {
    auto key = CalloutServer::ReadDataFile(key_path);
    if (!key.ok()) {
      LOG(ERROR) << "Error reading the private key file on " << key_path
                 << ": " << key.status();
      return std::nullopt;
    }
    auto cert = CalloutServer::ReadDataFile(cert_path);
    if (!cert.ok()) {
      LOG(ERROR) << "Error reading the certificate file on " << cert_path
                 << ": " << cert.status();
      return std::nullopt;
    }

    grpc::SslServerCredentialsOptions::PemKeyCertPair key_cert_pair;
    key_cert_pair.private_key = *key;
    key_cert_pair.cert_chain = *cert;

    grpc::SslServerCredentialsOptions ssl_options;
    ssl_options.pem_key_cert_pairs.push_back(key_cert_pair);
    return grpc::SslServerCredentials(ssl_options);
  }

  /**
   * @brief Starts the gRPC server with custom credentials
   * @param server_address Address to bind the server to
   * @param service Reference to the callout service implementation
   * @param credentials Server credentials to use
   * @param wait Whether to block until server shutdown
   * @return Unique pointer to the gRPC server instance, null on bind failure
   */
  static std::unique_ptr<grpc::Server> RunServer(
      std::string_view server_address, CalloutServer& service,
      std::shared_ptr<grpc::ServerCredentials> credentials, bool wait) {
    grpc::EnableDefaultHealthCheckService(true);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(std::string{server_address}, credentials);
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (server == nullptr) {
      LOG(ERROR) << "Failed to start the ext_proc server on " << server_address;
      return nullptr;
    }
    LOG(INFO) << "Envoy Ext Proc server listening on " << server_address;

    if (wait) {
      server->Wait();
    }
    return server;
  }

  /**
   * @brief Starts the secure and/or insecure listeners and blocks
   * @param config Listener settings
   * @param service Reference to the callout service implementation
   * @return False when no listener could be started
   */
  static bool RunServers(const ServerConfig& config, CalloutServer& service) {
    std::vector<std::unique_ptr<grpc::Server>> servers;
    if (!config.key_path.empty() && !config.cert_path.empty()) {
      auto credentials =
          CreateSecureServerCredentials(config.key_path, config.cert_path);
      if (credentials.has_value()) {
        servers.push_back(RunServer(config.secure_address, service,
                                    *credentials, false));
      }
    }
    if (config.enable_insecure) {
      servers.push_back(RunServer(config.insecure_address, service,
                                  grpc::InsecureServerCredentials(), false));
    }

    bool started = false;
    for (const auto& server : servers) {
      started = started || server != nullptr;
    }
    if (!started) {
      LOG(ERROR) << "No ext_proc listener could be started";
      return false;
    }
    for (const auto& server : servers) {
      if (server != nullptr) {
        server->Wait();
      }
    }
    return true;
  }

  /**
   * @brief Main processing loop for handling gRPC streams
   * @param context Server context
   * @param stream Bidirectional gRPC stream
   * @return gRPC status
   */
  grpc::Status Process(
      grpc::ServerContext* context,
      grpc::ServerReaderWriter<ProcessingResponse, ProcessingRequest>* stream)
      override {
    (void)context;

    std::unique_ptr<StreamContext> stream_context = NewStreamContext();
    ProcessingRequest request;
    while (stream->Read(&request)) {
      ProcessingResponse response;
      ProcessRequest(stream_context.get(), &request, &response);
      if (!stream->Write(response)) {
        LOG(WARNING) << "ext_proc stream closed while writing a response.";
        break;
      }
    }

    return grpc::Status::OK;
  }

  /**
   * @brief Creates the per-stream state handed to the handlers
   * @return The state, or null when the callout keeps none
   */
  virtual std::unique_ptr<StreamContext> NewStreamContext() { return nullptr; }

  /**
   * @brief Handle HTTP request headers (to be overridden)
   * @param stream State of the current stream, may be null
   * @param request Incoming processing request
   * @param response Output response to populate
   */
  virtual void OnRequestHeader(StreamContext* stream,
                               ProcessingRequest* request,
                               ProcessingResponse* response) {
    response->mutable_request_headers();
  }

  /**
   * @brief Handle HTTP response headers (to be overridden)
   * @param stream State of the current stream, may be null
   * @param request Incoming processing request
   * @param response Output response to populate
   */
  virtual void OnResponseHeader(StreamContext* stream,
                                ProcessingRequest* request,
                                ProcessingResponse* response) {
    response->mutable_response_headers();
  }

 private:
  /**
   * @brief Reads file contents from disk
   * @param path File path to read
   * @return StatusOr containing file contents or error
   */
  static absl::StatusOr<std::string> ReadDataFile(std::string_view path) {
    std::ifstream file(std::string{path}, std::ios::binary);
    if (file.fail()) {
      return absl::NotFoundError(
          absl::StrCat("failed to open: ", path, ", error: ", strerror(errno)));
    }
    std::stringstream file_string_stream;
    file_string_stream << file.rdbuf();
    return file_string_stream.str();
  }

  /**
   * @brief Routes processing requests to appropriate handlers
   * @param stream State of the current stream
   * @param request Incoming processing request
   * @param response Output response to populate
   */
  void ProcessRequest(StreamContext* stream, ProcessingRequest* request,
                      ProcessingResponse* response) {
    switch (request->request_case()) {
      case ProcessingRequest::RequestCase::kRequestHeaders:
        this->OnRequestHeader(stream, request, response);
        break;
      case ProcessingRequest::RequestCase::kResponseHeaders:
        this->OnResponseHeader(stream, request, response);
        break;
      // Bodies and trailers pass through untouched.
      case ProcessingRequest::RequestCase::kRequestBody:
        response->mutable_request_body();
        break;
      case ProcessingRequest::RequestCase::kResponseBody:
        response->mutable_response_body();
        break;
      case ProcessingRequest::RequestCase::kRequestTrailers:
        response->mutable_request_trailers();
        break;
      case ProcessingRequest::RequestCase::kResponseTrailers:
        response->mutable_response_trailers();
        break;
      case ProcessingRequest::RequestCase::REQUEST_NOT_SET:
      default:
        LOG(WARNING) << "Received a ProcessingRequest with no request data.";
        break;
    }
  }
};

#endif  // CONTENT_EXPERIMENTS_CALLOUT_SERVER_H
