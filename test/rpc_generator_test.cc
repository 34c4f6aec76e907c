#include "src/rpc_generator.h"

#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include <gtest/gtest.h>

#include "src/options.h"
#include "src/service_model.h"

namespace {

using protorpc_generator::FormatMethodPath;
using protorpc_generator::GenerateClient;
using protorpc_generator::GenerateServer;
using protorpc_generator::GenerationOptions;
using protorpc_generator::GetStreamingMode;
using protorpc_generator::MethodModel;
using protorpc_generator::ServiceGenerator;
using protorpc_generator::ServiceModel;
using protorpc_generator::StreamingMode;

constexpr char kCodec[] = "::protorpc::ProtobufCodec";

MethodModel MakeMethod(const std::string &route_name, const std::string &name,
                       bool client_streaming, bool server_streaming,
                       const std::string &codec = kCodec) {
  return MethodModel(name, route_name, "::testing::GetRequest",
                     "::testing::GetResponse", client_streaming,
                     server_streaming, codec);
}

ServiceModel StreamingService(const std::string &package = "testing") {
  std::vector<MethodModel> methods;
  methods.push_back(MakeMethod("GetUnary", "get_unary", false, false));
  methods.push_back(MakeMethod("GetClientStreaming", "get_client_streaming",
                               true, false));
  methods.push_back(MakeMethod("GetServerStreaming", "get_server_streaming",
                               false, true));
  methods.push_back(MakeMethod("GetBidirectionalStreaming",
                               "get_bidirectional_streaming", true, true));
  return ServiceModel("Streaming", "Streaming", package,
                      "test_streaming_rpc.proto", std::move(methods));
}

size_t CountOf(absl::string_view haystack, absl::string_view needle) {
  size_t count = 0;
  for (size_t pos = haystack.find(needle); pos != absl::string_view::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++count;
  }
  return count;
}

TEST(RpcGeneratorTest, StreamingModes) {
  EXPECT_EQ(GetStreamingMode(MakeMethod("A", "a", false, false)),
            StreamingMode::kUnary);
  EXPECT_EQ(GetStreamingMode(MakeMethod("A", "a", true, false)),
            StreamingMode::kClientStreaming);
  EXPECT_EQ(GetStreamingMode(MakeMethod("A", "a", false, true)),
            StreamingMode::kServerStreaming);
  EXPECT_EQ(GetStreamingMode(MakeMethod("A", "a", true, true)),
            StreamingMode::kBidiStreaming);
}

TEST(RpcGeneratorTest, MethodPathUsesRouteName) {
  ServiceModel service = StreamingService();
  EXPECT_EQ(FormatMethodPath(service, service.method_models()[0]),
            "/testing.Streaming/GetUnary");
  EXPECT_EQ(FormatMethodPath(service, service.method_models()[3]),
            "/testing.Streaming/GetBidirectionalStreaming");

  ServiceModel unpackaged = StreamingService("");
  EXPECT_EQ(FormatMethodPath(unpackaged, unpackaged.method_models()[1]),
            "/Streaming/GetClientStreaming");
}

TEST(RpcGeneratorTest, ClientMethodShapes) {
  const std::string client =
      GenerateClient(StreamingService(), GenerationOptions());

  EXPECT_TRUE(absl::StrContains(client, "#include \"test_streaming_rpc.pb.h\""));
  EXPECT_TRUE(absl::StrContains(client, "namespace testing {"));
  EXPECT_TRUE(absl::StrContains(client, "namespace streaming_client {"));
  EXPECT_TRUE(absl::StrContains(client, "class StreamingClient {"));
  EXPECT_TRUE(absl::StrContains(
      client, "absl::StatusOr<::testing::GetResponse> "
              "get_unary(const ::testing::GetRequest &request) {"));
  EXPECT_TRUE(absl::StrContains(client, "::protorpc::UnaryCall(*channel_, "
                                        "\"/testing.Streaming/GetUnary\""));
  EXPECT_TRUE(absl::StrContains(
      client, "::protorpc::ClientStream<::protorpc::ProtobufCodec<"
              "::testing::GetRequest, ::testing::GetResponse>> "
              "get_client_streaming() {"));
  EXPECT_TRUE(absl::StrContains(
      client, "absl::StatusOr<::protorpc::ClientStream<"
              "::protorpc::ProtobufCodec<::testing::GetRequest, "
              "::testing::GetResponse>>>\n"));
  EXPECT_TRUE(absl::StrContains(
      client, "get_server_streaming(const ::testing::GetRequest &request) {"));
  EXPECT_TRUE(
      absl::StrContains(client, "get_bidirectional_streaming() {"));
  EXPECT_TRUE(absl::StrContains(client, "static absl::StatusOr<StreamingClient> "
                                        "Connect(absl::string_view target) {"));
}

TEST(RpcGeneratorTest, ServerMethodShapes) {
  const std::string server =
      GenerateServer(StreamingService(), GenerationOptions());

  EXPECT_TRUE(absl::StrContains(server, "namespace streaming_server {"));
  EXPECT_TRUE(absl::StrContains(server, "class Streaming {"));
  EXPECT_TRUE(absl::StrContains(server, "class StreamingServer {"));
  EXPECT_TRUE(absl::StrContains(
      server, "static constexpr char kServiceName[] = \"testing.Streaming\";"));
  EXPECT_TRUE(absl::StrContains(
      server, "virtual absl::StatusOr<::testing::GetResponse>\n"));
  EXPECT_TRUE(absl::StrContains(
      server, "get_unary(const ::testing::GetRequest &request) = 0;"));
  // Servers decode requests and encode responses.
  EXPECT_TRUE(absl::StrContains(
      server, "get_client_streaming(::protorpc::ServerStream<"
              "::protorpc::ProtobufCodec<::testing::GetResponse, "
              "::testing::GetRequest>> &requests) = 0;"));
  EXPECT_TRUE(absl::StrContains(server, "&responses) = 0;"));
  EXPECT_TRUE(absl::StrContains(server, "&stream) = 0;"));
  EXPECT_EQ(CountOf(server, "router.AddRoute("), 4u);
  EXPECT_TRUE(absl::StrContains(
      server, "\"/testing.Streaming/GetBidirectionalStreaming\""));
  EXPECT_TRUE(absl::StrContains(server, "::protorpc::ServeUnary("));
  EXPECT_TRUE(absl::StrContains(server, "::protorpc::ServeClientStreaming("));
  EXPECT_TRUE(absl::StrContains(server, "::protorpc::ServeServerStreaming("));
  EXPECT_TRUE(absl::StrContains(server, "::protorpc::ServeBidiStreaming("));
  EXPECT_TRUE(absl::StrContains(server, "return absl::OkStatus();"));
}

TEST(RpcGeneratorTest, CustomCodecAndProtoPath) {
  std::vector<MethodModel> methods;
  methods.push_back(MakeMethod("Get", "get", false, false, "::my::Codec"));
  ServiceModel service("Kv", "Kv", "store", "", std::move(methods));
  GenerationOptions options;
  options.proto_path = "::protos";

  const std::string client = GenerateClient(service, options);
  EXPECT_TRUE(absl::StrContains(
      client, "::my::Codec<::protos::testing::GetRequest, "
              "::protos::testing::GetResponse>()"));
  EXPECT_FALSE(absl::StrContains(client, "ProtobufCodec"));
  // No source file, no proto include.
  EXPECT_FALSE(absl::StrContains(client, "#include"));

  const std::string server = GenerateServer(service, options);
  EXPECT_TRUE(absl::StrContains(
      server, "::my::Codec<::protos::testing::GetResponse, "
              "::protos::testing::GetRequest>()"));
}

TEST(RpcGeneratorTest, TransportGlueCanBeDisabled) {
  GenerationOptions options;
  options.build_transport = false;
  const std::string client = GenerateClient(StreamingService(), options);
  EXPECT_FALSE(absl::StrContains(client, "Connect("));
  EXPECT_TRUE(absl::StrContains(client, "class StreamingClient {"));
}

TEST(RpcGeneratorTest, ServiceWithoutMethodsGeneratesNothing) {
  ServiceModel empty("Empty", "Empty", "testing", "empty.proto", {});
  EXPECT_EQ(GenerateClient(empty, GenerationOptions()), "");
  EXPECT_EQ(GenerateServer(empty, GenerationOptions()), "");

  ServiceGenerator generator{GenerationOptions()};
  generator.Generate(empty);
  std::string buf;
  generator.Finalize(&buf);
  EXPECT_EQ(buf, "");
}

TEST(RpcGeneratorTest, CommentsAndDeprecation) {
  std::vector<MethodModel> methods;
  methods.push_back(MethodModel("old", "Old", "::testing::GetRequest",
                                "::testing::GetResponse", false, false,
                                kCodec, " Use New instead.\n", true));
  ServiceModel service("Legacy", "Legacy", "testing", "legacy.proto",
                       std::move(methods), " Legacy API.\n Second line.\n");

  const std::string client = GenerateClient(service, GenerationOptions());
  EXPECT_TRUE(absl::StrContains(client, "// Legacy API.\n// Second line.\n"
                                        "class LegacyClient {"));
  EXPECT_TRUE(absl::StrContains(client, "// Use New instead.\n"
                                        "  [[deprecated]]\n"
                                        "  absl::StatusOr<"));

  const std::string server = GenerateServer(service, GenerationOptions());
  EXPECT_TRUE(absl::StrContains(server, "// Use New instead.\n"));
  EXPECT_FALSE(absl::StrContains(server, "[[deprecated]]"));
}

TEST(RpcGeneratorTest, CommentBackslashesDoNotContinueLines) {
  std::vector<MethodModel> methods;
  methods.push_back(MethodModel("put", "Put", "::testing::GetRequest",
                                "::testing::GetResponse", false, false,
                                kCodec, " Escapes with \\ \\\n"));
  ServiceModel service("Svc", "Svc", "testing", "svc.proto",
                       std::move(methods),
                       " Files live under C:\\data\\\n Second \\ line\n");

  const std::string client = GenerateClient(service, GenerationOptions());
  EXPECT_TRUE(absl::StrContains(client, "// Files live under C:\\data\n"
                                        "// Second \\ line\n"
                                        "class SvcClient {"))
      << client;
  EXPECT_TRUE(absl::StrContains(client, "// Escapes with\n")) << client;
  EXPECT_FALSE(absl::StrContains(client, "\\\n")) << client;

  const std::string server = GenerateServer(service, GenerationOptions());
  EXPECT_FALSE(absl::StrContains(server, "\\\n")) << server;
}

TEST(RpcGeneratorTest, FinalizeEmitsClientsBeforeServers) {
  ServiceGenerator generator{GenerationOptions()};
  generator.Generate(StreamingService());
  EXPECT_FALSE(generator.clients().empty());
  EXPECT_FALSE(generator.servers().empty());

  std::string buf;
  generator.Finalize(&buf);
  EXPECT_TRUE(absl::StartsWith(
      buf, "// Generated by protoc-gen-protorpc. DO NOT EDIT!\n"));
  EXPECT_EQ(CountOf(buf, "#pragma once"), 1u);
  EXPECT_TRUE(absl::StrContains(buf, "#include \"src/runtime/client.h\""));
  EXPECT_TRUE(absl::StrContains(buf, "#include \"src/runtime/server.h\""));

  const size_t client_pos = buf.find("class StreamingClient");
  const size_t server_pos = buf.find("class StreamingServer");
  ASSERT_NE(client_pos, std::string::npos);
  ASSERT_NE(server_pos, std::string::npos);
  EXPECT_LT(client_pos, server_pos);

  // Both accumulators are reset.
  EXPECT_TRUE(generator.clients().empty());
  EXPECT_TRUE(generator.servers().empty());
  std::string again;
  generator.Finalize(&again);
  EXPECT_EQ(again, "");
}

TEST(RpcGeneratorTest, FinalizeAppendsToBuffer) {
  ServiceGenerator generator{GenerationOptions()};
  generator.Generate(StreamingService());
  std::string buf = "existing\n";
  generator.Finalize(&buf);
  EXPECT_TRUE(absl::StartsWith(buf, "existing\n// Generated by"));
}

TEST(RpcGeneratorTest, GeneratedBatchesUntilFinalized) {
  ServiceGenerator generator{GenerationOptions()};
  generator.Generate(StreamingService("alpha"));
  generator.Generate(StreamingService("beta"));
  std::string buf;
  generator.Finalize(&buf);
  EXPECT_EQ(CountOf(buf, "class StreamingClient {"), 2u);
  EXPECT_EQ(CountOf(buf, "class StreamingServer {"), 2u);
  EXPECT_TRUE(absl::StrContains(buf, "namespace alpha {"));
  EXPECT_TRUE(absl::StrContains(buf, "namespace beta {"));
}

TEST(RpcGeneratorTest, DisabledHalvesAreOmitted) {
  GenerationOptions client_only;
  client_only.build_server = false;
  ServiceGenerator clients(client_only);
  clients.Generate(StreamingService());
  EXPECT_TRUE(clients.servers().empty());
  std::string buf;
  clients.Finalize(&buf);
  EXPECT_TRUE(absl::StrContains(buf, "class StreamingClient {"));
  EXPECT_FALSE(absl::StrContains(buf, "StreamingServer"));
  EXPECT_FALSE(absl::StrContains(buf, "src/runtime/server.h"));

  GenerationOptions server_only;
  server_only.build_client = false;
  ServiceGenerator servers(server_only);
  servers.Generate(StreamingService());
  buf.clear();
  servers.Finalize(&buf);
  EXPECT_TRUE(absl::StrContains(buf, "class StreamingServer {"));
  EXPECT_FALSE(absl::StrContains(buf, "StreamingClient"));
  EXPECT_FALSE(absl::StrContains(buf, "src/runtime/client.h"));

  GenerationOptions neither;
  neither.build_client = false;
  neither.build_server = false;
  ServiceGenerator nothing(neither);
  nothing.Generate(StreamingService());
  buf.clear();
  nothing.Finalize(&buf);
  EXPECT_EQ(buf, "");
}

} // namespace
