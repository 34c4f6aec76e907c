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

#ifndef NET_PROTORPC_COMPILER_SERVICE_MODEL_H_
#define NET_PROTORPC_COMPILER_SERVICE_MODEL_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include <google/protobuf/descriptor.pb.h>

#include "src/rpc_generator.h"

namespace protorpc_generator {

/// A service method as resolved from the descriptor set.
class MethodModel : public Method {
public:
  MethodModel(std::string name, std::string route_name, std::string input_type,
              std::string output_type, bool client_streaming,
              bool server_streaming, std::string codec_path,
              std::string comment = "", bool deprecated = false)
      : name_(std::move(name)), route_name_(std::move(route_name)),
        input_type_(std::move(input_type)),
        output_type_(std::move(output_type)),
        client_streaming_(client_streaming),
        server_streaming_(server_streaming),
        codec_path_(std::move(codec_path)), comment_(std::move(comment)),
        deprecated_(deprecated) {}

  absl::string_view name() const override { return name_; }
  absl::string_view identifier() const override { return route_name_; }
  absl::string_view codec_path() const override { return codec_path_; }
  bool is_client_streaming() const override { return client_streaming_; }
  bool is_server_streaming() const override { return server_streaming_; }
  absl::string_view comment() const override { return comment_; }
  bool is_deprecated() const override { return deprecated_; }

  /// Type references without the namespace root, e.g. "::package::Message".
  absl::string_view input_type() const { return input_type_; }
  absl::string_view output_type() const { return output_type_; }

  std::pair<std::string, std::string>
  get_request_response_name(absl::string_view proto_path) const override;

private:
  std::string name_;
  std::string route_name_;
  std::string input_type_;
  std::string output_type_;
  bool client_streaming_;
  bool server_streaming_;
  std::string codec_path_;
  std::string comment_;
  bool deprecated_;
};

/// A service and its methods in declaration order.
class ServiceModel : public Service {
public:
  ServiceModel(std::string name, std::string identifier, std::string package,
               std::string source_file, std::vector<MethodModel> methods,
               std::string comment = "")
      : name_(std::move(name)), identifier_(std::move(identifier)),
        package_(std::move(package)), source_file_(std::move(source_file)),
        methods_(std::move(methods)), comment_(std::move(comment)) {}

  absl::string_view name() const override { return name_; }
  absl::string_view package() const override { return package_; }
  absl::string_view identifier() const override { return identifier_; }
  absl::string_view source_file() const override { return source_file_; }
  std::vector<const Method *> methods() const override;
  absl::string_view comment() const override { return comment_; }

  const std::vector<MethodModel> &method_models() const { return methods_; }

private:
  std::string name_;
  std::string identifier_;
  std::string package_;
  std::string source_file_;
  std::vector<MethodModel> methods_;
  std::string comment_;
};

/**
 * Builds one ServiceModel per service declared in `file`, in declaration
 * order. Every method gets `codec_path` as its codec.
 *
 * Fails with INVALID_ARGUMENT, and returns nothing, when a service or method
 * is unnamed or a request/response type path cannot be resolved.
 */
absl::StatusOr<std::vector<ServiceModel>>
BuildServices(const google::protobuf::FileDescriptorProto &file,
              absl::string_view codec_path);

/// BuildServices() over every file of `files`, preserving file order.
absl::StatusOr<std::vector<ServiceModel>>
BuildServiceModels(const google::protobuf::FileDescriptorSet &files,
                   absl::string_view codec_path);

} // namespace protorpc_generator

#endif // NET_PROTORPC_COMPILER_SERVICE_MODEL_H_
