#include "src/service_model.h"

#include <algorithm>
#include <initializer_list>
#include <iterator>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

#include "src/naming.h"

namespace protorpc_generator {
namespace protobuf = google::protobuf;

using protobuf::FileDescriptorProto;
using protobuf::MethodDescriptorProto;
using protobuf::ServiceDescriptorProto;
using protobuf::SourceCodeInfo;

namespace {

// Leading comments of the element at `path`, falling back to its trailing
// comments. Empty when the descriptor carries no source info.
std::string CommentsAt(const FileDescriptorProto &file,
                       std::initializer_list<int> path) {
  for (const SourceCodeInfo::Location &location :
       file.source_code_info().location()) {
    if (std::equal(location.path().begin(), location.path().end(),
                   path.begin(), path.end())) {
      return location.leading_comments().empty()
                 ? location.trailing_comments()
                 : location.leading_comments();
    }
  }
  return std::string();
}

absl::Status SchemaError(const FileDescriptorProto &file,
                         absl::string_view what, absl::string_view detail) {
  return absl::InvalidArgumentError(
      absl::StrCat(file.name(), ": ", what, ": ", detail));
}

absl::StatusOr<MethodModel> BuildMethod(const FileDescriptorProto &file,
                                        int service_index, int index,
                                        absl::string_view codec_path) {
  const ServiceDescriptorProto &service = file.service(service_index);
  const MethodDescriptorProto &method = service.method(index);
  const std::string where = absl::StrCat(service.name(), ".", method.name());
  if (method.name().empty()) {
    return SchemaError(file, service.name(),
                       absl::StrCat("method #", index, " has no name"));
  }
  absl::StatusOr<std::string> input = QualifyType(method.input_type(), "");
  if (!input.ok()) {
    return SchemaError(file, where, input.status().message());
  }
  absl::StatusOr<std::string> output = QualifyType(method.output_type(), "");
  if (!output.ok()) {
    return SchemaError(file, where, output.status().message());
  }
  return MethodModel(
      SafeIdentifier(IdentifierCase(method.name())), method.name(),
      *std::move(input), *std::move(output), method.client_streaming(),
      method.server_streaming(), std::string(codec_path),
      CommentsAt(file, {FileDescriptorProto::kServiceFieldNumber,
                        service_index,
                        ServiceDescriptorProto::kMethodFieldNumber, index}),
      method.options().deprecated());
}

} // namespace

std::pair<std::string, std::string>
MethodModel::get_request_response_name(absl::string_view proto_path) const {
  return std::make_pair(absl::StrCat(proto_path, input_type_),
                        absl::StrCat(proto_path, output_type_));
}

std::vector<const Method *> ServiceModel::methods() const {
  std::vector<const Method *> ret;
  ret.reserve(methods_.size());
  for (const MethodModel &method : methods_) {
    ret.push_back(&method);
  }
  return ret;
}

absl::StatusOr<std::vector<ServiceModel>>
BuildServices(const FileDescriptorProto &file, absl::string_view codec_path) {
  const std::string package = NamespaceOf(file.package());
  std::vector<ServiceModel> services;
  services.reserve(file.service_size());
  for (int i = 0; i < file.service_size(); ++i) {
    const ServiceDescriptorProto &service = file.service(i);
    if (TypeCase(service.name()).empty()) {
      return SchemaError(file, "service",
                         absl::StrCat("service #", i, " has no usable name"));
    }
    std::vector<MethodModel> methods;
    methods.reserve(service.method_size());
    for (int j = 0; j < service.method_size(); ++j) {
      absl::StatusOr<MethodModel> method =
          BuildMethod(file, i, j, codec_path);
      if (!method.ok()) {
        return method.status();
      }
      methods.push_back(*std::move(method));
    }
    services.emplace_back(
        TypeCase(service.name()), service.name(), package, file.name(),
        std::move(methods),
        CommentsAt(file, {FileDescriptorProto::kServiceFieldNumber, i}));
  }
  return services;
}

absl::StatusOr<std::vector<ServiceModel>>
BuildServiceModels(const protobuf::FileDescriptorSet &files,
                   absl::string_view codec_path) {
  std::vector<ServiceModel> services;
  for (const FileDescriptorProto &file : files.file()) {
    absl::StatusOr<std::vector<ServiceModel>> built =
        BuildServices(file, codec_path);
    if (!built.ok()) {
      return built.status();
    }
    std::move(built->begin(), built->end(), std::back_inserter(services));
  }
  return services;
}

} // namespace protorpc_generator
