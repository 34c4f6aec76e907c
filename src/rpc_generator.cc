#include "src/rpc_generator.h"

#include <map>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include <google/protobuf/io/printer.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "src/naming.h"

namespace protorpc_generator {
namespace protobuf = google::protobuf;

using protobuf::io::Printer;

namespace {

using Vars = std::map<std::string, std::string>;

std::string ServiceFullName(const Service &service) {
  if (service.package().empty()) {
    return std::string(service.identifier());
  }
  return absl::StrCat(service.package(), ".", service.identifier());
}

void PrintComment(absl::string_view comment, Printer *p) {
  std::vector<absl::string_view> lines = absl::StrSplit(comment, '\n');
  while (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }
  for (absl::string_view line : lines) {
    // A trailing backslash would splice the next generated line into the
    // comment.
    line = absl::StripTrailingAsciiWhitespace(line);
    while (absl::ConsumeSuffix(&line, "\\")) {
      line = absl::StripTrailingAsciiWhitespace(line);
    }
    p->Print("//$line$\n", "line", std::string(line));
  }
}

void PrintProtoInclude(const Service &service, Printer *p) {
  if (service.source_file().empty()) {
    return;
  }
  p->Print("#include \"$header$\"\n\n", "header",
           absl::StrCat(StripProto(service.source_file()), ".pb.h"));
}

void OpenNamespaces(const Service &service, const std::string &module,
                    Printer *p) {
  if (!service.package().empty()) {
    p->Print("namespace $package$ {\n", "package",
             std::string(service.package()));
  }
  p->Print("namespace $module$ {\n\n", "module", module);
}

void CloseNamespaces(const Service &service, const std::string &module,
                     Printer *p) {
  p->Print("\n} // namespace $module$\n", "module", module);
  if (!service.package().empty()) {
    p->Print("} // namespace $package$\n", "package",
             std::string(service.package()));
  }
  p->Print("\n");
}

Vars MethodVars(const Service &service, const Method &method,
                const GenerationOptions &options) {
  std::pair<std::string, std::string> types =
      method.get_request_response_name(options.proto_path);
  Vars vars;
  vars["method"] = std::string(method.name());
  vars["path"] = FormatMethodPath(service, method);
  vars["request"] = types.first;
  vars["response"] = types.second;
  // Clients encode requests and decode responses; servers the other way.
  vars["client_codec"] = absl::StrCat(method.codec_path(), "<", types.first,
                                      ", ", types.second, ">");
  vars["server_codec"] = absl::StrCat(method.codec_path(), "<", types.second,
                                      ", ", types.first, ">");
  return vars;
}

void PrintClientMethod(const Service &service, const Method &method,
                       const GenerationOptions &options, Printer *p) {
  Vars vars = MethodVars(service, method, options);
  p->Print("\n");
  PrintComment(method.comment(), p);
  if (method.is_deprecated()) {
    p->Print("[[deprecated]]\n");
  }
  switch (GetStreamingMode(method)) {
  case StreamingMode::kUnary:
    p->Print(vars,
             "absl::StatusOr<$response$> $method$(const $request$ &request) {\n"
             "  return ::protorpc::UnaryCall(*channel_, \"$path$\", request,\n"
             "                               $client_codec$());\n"
             "}\n");
    break;
  case StreamingMode::kServerStreaming:
    p->Print(vars,
             "absl::StatusOr<::protorpc::ClientStream<$client_codec$>>\n"
             "$method$(const $request$ &request) {\n"
             "  return ::protorpc::ServerStreamingCall(*channel_, \"$path$\",\n"
             "                                         request, "
             "$client_codec$());\n"
             "}\n");
    break;
  case StreamingMode::kClientStreaming:
  case StreamingMode::kBidiStreaming:
    p->Print(vars,
             "::protorpc::ClientStream<$client_codec$> $method$() {\n"
             "  return ::protorpc::StartCall(*channel_, \"$path$\",\n"
             "                               $client_codec$());\n"
             "}\n");
    break;
  }
}

void PrintServiceMethod(const Service &service, const Method &method,
                        const GenerationOptions &options, Printer *p) {
  Vars vars = MethodVars(service, method, options);
  p->Print("\n");
  PrintComment(method.comment(), p);
  switch (GetStreamingMode(method)) {
  case StreamingMode::kUnary:
    p->Print(vars, "virtual absl::StatusOr<$response$>\n"
                   "$method$(const $request$ &request) = 0;\n");
    break;
  case StreamingMode::kClientStreaming:
    p->Print(vars, "virtual absl::StatusOr<$response$>\n"
                   "$method$(::protorpc::ServerStream<$server_codec$> "
                   "&requests) = 0;\n");
    break;
  case StreamingMode::kServerStreaming:
    p->Print(vars, "virtual absl::Status\n"
                   "$method$(const $request$ &request,\n"
                   "    ::protorpc::ServerStream<$server_codec$> &responses) "
                   "= 0;\n");
    break;
  case StreamingMode::kBidiStreaming:
    p->Print(vars, "virtual absl::Status\n"
                   "$method$(::protorpc::ServerStream<$server_codec$> &stream) "
                   "= 0;\n");
    break;
  }
}

void PrintRoute(const Service &service, const Method &method,
                const GenerationOptions &options, Printer *p) {
  Vars vars = MethodVars(service, method, options);
  p->Print(vars, "status = router.AddRoute(\n"
                 "    \"$path$\", [inner](::protorpc::ServerCall &call) {\n");
  p->Indent();
  p->Indent();
  p->Indent();
  switch (GetStreamingMode(method)) {
  case StreamingMode::kUnary:
    p->Print(vars, "return ::protorpc::ServeUnary(\n"
                   "    call, $server_codec$(),\n"
                   "    [&inner](const $request$ &request) {\n"
                   "      return inner->$method$(request);\n"
                   "    });\n");
    break;
  case StreamingMode::kClientStreaming:
    p->Print(vars,
             "return ::protorpc::ServeClientStreaming(\n"
             "    call, $server_codec$(),\n"
             "    [&inner](::protorpc::ServerStream<$server_codec$> &requests) "
             "{\n"
             "      return inner->$method$(requests);\n"
             "    });\n");
    break;
  case StreamingMode::kServerStreaming:
    p->Print(vars,
             "return ::protorpc::ServeServerStreaming(\n"
             "    call, $server_codec$(),\n"
             "    [&inner](const $request$ &request,\n"
             "             ::protorpc::ServerStream<$server_codec$> &responses) "
             "{\n"
             "      return inner->$method$(request, responses);\n"
             "    });\n");
    break;
  case StreamingMode::kBidiStreaming:
    p->Print(vars,
             "return ::protorpc::ServeBidiStreaming(\n"
             "    call, $server_codec$(),\n"
             "    [&inner](::protorpc::ServerStream<$server_codec$> &stream) {\n"
             "      return inner->$method$(stream);\n"
             "    });\n");
    break;
  }
  p->Outdent();
  p->Outdent();
  p->Outdent();
  p->Print("  });\n"
           "if (!status.ok()) {\n"
           "  return status;\n"
           "}\n");
}

} // namespace

StreamingMode GetStreamingMode(const Method &method) {
  if (method.is_client_streaming()) {
    return method.is_server_streaming() ? StreamingMode::kBidiStreaming
                                        : StreamingMode::kClientStreaming;
  }
  return method.is_server_streaming() ? StreamingMode::kServerStreaming
                                      : StreamingMode::kUnary;
}

std::string FormatMethodPath(const Service &service, const Method &method) {
  return absl::StrFormat("/%s/%s", ServiceFullName(service),
                         method.identifier());
}

std::string GenerateClient(const Service &service,
                           const GenerationOptions &options) {
  std::string fragment;
  const std::vector<const Method *> methods = service.methods();
  if (methods.empty()) {
    return fragment;
  }
  {
    protobuf::io::StringOutputStream output(&fragment);
    Printer printer(&output, '$');
    Vars vars;
    vars["client"] = absl::StrCat(service.name(), "Client");
    vars["module"] = absl::StrCat(IdentifierCase(service.name()), "_client");

    PrintProtoInclude(service, &printer);
    OpenNamespaces(service, vars["module"], &printer);
    PrintComment(service.comment(), &printer);
    printer.Print(vars, "class $client$ {\n"
                        "public:\n");
    printer.Indent();
    printer.Print(vars,
                  "explicit $client$(std::shared_ptr<::protorpc::Channel> "
                  "channel)\n"
                  "    : channel_(std::move(channel)) {}\n");
    if (options.build_transport) {
      printer.Print(
          vars,
          "\n"
          "/// Connects through the transport installed with\n"
          "/// ::protorpc::SetChannelFactory().\n"
          "static absl::StatusOr<$client$> Connect(absl::string_view target) "
          "{\n"
          "  absl::StatusOr<std::shared_ptr<::protorpc::Channel>> channel =\n"
          "      ::protorpc::Connect(target);\n"
          "  if (!channel.ok()) {\n"
          "    return channel.status();\n"
          "  }\n"
          "  return $client$(*std::move(channel));\n"
          "}\n");
    }
    for (const Method *method : methods) {
      PrintClientMethod(service, *method, options, &printer);
    }
    printer.Outdent();
    printer.Print("\n"
                  "private:\n"
                  "  std::shared_ptr<::protorpc::Channel> channel_;\n"
                  "};\n");
    CloseNamespaces(service, vars["module"], &printer);
  }
  return fragment;
}

std::string GenerateServer(const Service &service,
                           const GenerationOptions &options) {
  std::string fragment;
  const std::vector<const Method *> methods = service.methods();
  if (methods.empty()) {
    return fragment;
  }
  {
    protobuf::io::StringOutputStream output(&fragment);
    Printer printer(&output, '$');
    Vars vars;
    vars["service"] = std::string(service.name());
    vars["server"] = absl::StrCat(service.name(), "Server");
    vars["module"] = absl::StrCat(IdentifierCase(service.name()), "_server");
    vars["full_name"] = ServiceFullName(service);

    PrintProtoInclude(service, &printer);
    OpenNamespaces(service, vars["module"], &printer);
    PrintComment(service.comment(), &printer);
    printer.Print(vars, "class $service$ {\n"
                        "public:\n");
    printer.Indent();
    printer.Print(vars, "virtual ~$service$() = default;\n");
    for (const Method *method : methods) {
      PrintServiceMethod(service, *method, options, &printer);
    }
    printer.Outdent();
    printer.Print("};\n\n");

    printer.Print(vars, "class $server$ {\n"
                        "public:\n");
    printer.Indent();
    printer.Print(vars,
                  "static constexpr char kServiceName[] = \"$full_name$\";\n"
                  "\n"
                  "explicit $server$(std::shared_ptr<$service$> inner)\n"
                  "    : inner_(std::move(inner)) {}\n"
                  "\n"
                  "/// Routes every method of $full_name$ to the wrapped "
                  "implementation.\n"
                  "absl::Status Register(::protorpc::Router &router) const {\n");
    printer.Indent();
    printer.Print(vars, "std::shared_ptr<$service$> inner = inner_;\n"
                        "absl::Status status;\n");
    for (const Method *method : methods) {
      PrintRoute(service, *method, options, &printer);
    }
    printer.Print("return absl::OkStatus();\n");
    printer.Outdent();
    printer.Print("}\n");
    printer.Outdent();
    printer.Print(vars, "\n"
                        "private:\n"
                        "  std::shared_ptr<$service$> inner_;\n"
                        "};\n");
    CloseNamespaces(service, vars["module"], &printer);
  }
  return fragment;
}

void ServiceGenerator::Generate(const Service &service) {
  if (options_.build_server) {
    servers_.append(GenerateServer(service, options_));
  }
  if (options_.build_client) {
    clients_.append(GenerateClient(service, options_));
  }
}

void ServiceGenerator::Finalize(std::string *buf) {
  const bool emit_clients = options_.build_client && !clients_.empty();
  const bool emit_servers = options_.build_server && !servers_.empty();
  if (emit_clients || emit_servers) {
    absl::StrAppend(buf, "// Generated by protoc-gen-protorpc. DO NOT EDIT!\n"
                         "\n"
                         "#pragma once\n"
                         "\n"
                         "#include <memory>\n"
                         "#include <utility>\n"
                         "\n"
                         "#include \"absl/status/status.h\"\n"
                         "#include \"absl/status/statusor.h\"\n"
                         "#include \"absl/strings/string_view.h\"\n");
    if (emit_clients) {
      absl::StrAppend(buf, "#include \"src/runtime/client.h\"\n");
    }
    if (emit_servers) {
      absl::StrAppend(buf, "#include \"src/runtime/server.h\"\n");
    }
    absl::StrAppend(buf, "\n");
  }
  if (emit_clients) {
    absl::StrAppend(buf, clients_);
  }
  if (emit_servers) {
    absl::StrAppend(buf, servers_);
  }
  clients_.clear();
  servers_.clear();
}

} // namespace protorpc_generator
