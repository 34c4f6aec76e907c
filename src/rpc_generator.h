/*
 * Copyright 2025 The gRPC Authors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef NET_PROTORPC_COMPILER_RPC_GENERATOR_H_
#define NET_PROTORPC_COMPILER_RPC_GENERATOR_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/strings/string_view.h"

#include "src/options.h"

namespace protorpc_generator {

/**
 * Method generation abstraction.
 *
 * Everything the emitter needs to know about one RPC method, independent of
 * where the schema came from.
 */
class Method {
public:
  virtual ~Method() = default;

  /// The name of the method as a C++ callable.
  virtual absl::string_view name() const = 0;

  /// The name of the method as it appears in the .proto file. Routes are
  /// built from this name only.
  virtual absl::string_view identifier() const = 0;

  /// Codec class template used for this method.
  virtual absl::string_view codec_path() const = 0;

  /// Checks if the method is streamed by the client.
  virtual bool is_client_streaming() const = 0;

  /// Checks if the method is streamed by the server.
  virtual bool is_server_streaming() const = 0;

  /// Get comments about this method.
  virtual absl::string_view comment() const = 0;

  /// Checks if the method is deprecated. Default is false.
  virtual bool is_deprecated() const { return false; }

  /**
   * Type name of request and response.
   * @param proto_path Namespace root the message types live under.
   * @return A pair of strings representing the generated request and response
   * type names.
   */
  virtual std::pair<std::string, std::string>
  get_request_response_name(absl::string_view proto_path) const = 0;
};

/**
 * Service generation abstraction.
 *
 * This class is an interface that can be implemented and consumed
 * by client and server generators to allow any codegen module
 * to generate service abstractions.
 */
class Service {
public:
  virtual ~Service() = default;

  /// The name of the service as a C++ type.
  virtual absl::string_view name() const = 0;

  /// The namespace the service's package resolves to.
  virtual absl::string_view package() const = 0;

  /// The name of the service as it appears in the .proto file.
  virtual absl::string_view identifier() const = 0;

  /// The .proto file declaring the service, empty when unknown.
  virtual absl::string_view source_file() const = 0;

  /**
   * Methods provided by the service, in declaration order.
   * @return Non-owning pointers; the Service keeps the Method objects alive.
   */
  virtual std::vector<const Method *> methods() const = 0;

  /// Get comments about this service.
  virtual absl::string_view comment() const = 0;
};

enum class StreamingMode {
  kUnary,
  kClientStreaming,
  kServerStreaming,
  kBidiStreaming,
};

StreamingMode GetStreamingMode(const Method &method);

/**
 * @brief Formats the full path for a method call.
 *
 * The package part is the flattened Service::package(), so a service in
 * "store.kv" is routed as "/kv.Kv/Get", not as "/store.kv.Kv/Get". Peers
 * built from the full package name will not match.
 *
 * @param service The service containing the method.
 * @param method The method to format the path for.
 * @return The formatted method path (e.g., "/package.MyService/MyMethod").
 */
std::string FormatMethodPath(const Service &service, const Method &method);

/// Client bindings for `service`; empty when it has no methods.
std::string GenerateClient(const Service &service,
                           const GenerationOptions &options);

/// Server bindings for `service`; empty when it has no methods.
std::string GenerateServer(const Service &service,
                           const GenerationOptions &options);

/**
 * Accumulates client and server fragments and renders them into one source
 * file.
 *
 * Generate() appends; Finalize() renders everything accumulated so far and
 * empties both accumulators. Flush once per service to get one independent
 * output per service.
 */
class ServiceGenerator {
public:
  explicit ServiceGenerator(GenerationOptions options)
      : options_(std::move(options)) {}

  void Generate(const Service &service);

  /// Appends the rendered source to `buf`; nothing when both halves are
  /// empty.
  void Finalize(std::string *buf);

  const std::string &clients() const { return clients_; }
  const std::string &servers() const { return servers_; }

private:
  GenerationOptions options_;
  std::string clients_;
  std::string servers_;
};

} // namespace protorpc_generator

#endif // NET_PROTORPC_COMPILER_RPC_GENERATOR_H_
