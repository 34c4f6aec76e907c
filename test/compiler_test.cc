#include "src/compiler.h"

#include <string>

#include "absl/strings/match.h"
#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/text_format.h>
#include <gtest/gtest.h>

#include "src/options.h"
#include "test/memory_sink.h"

namespace {

namespace protobuf = google::protobuf;

using protorpc_generator::Compile;
using protorpc_generator::GenerationOptions;
using protorpc_test::MemorySink;

protobuf::FileDescriptorSet TwoServices() {
  protobuf::FileDescriptorSet files;
  EXPECT_TRUE(protobuf::TextFormat::ParseFromString(R"pb(
    file {
      name: "kv.proto"
      package: "store.kv"
      service {
        name: "Kv"
        method {
          name: "Get"
          input_type: ".store.kv.GetRequest"
          output_type: ".store.kv.GetResponse"
        }
      }
      service {
        name: "Admin"
        method {
          name: "Compact"
          input_type: ".store.kv.CompactRequest"
          output_type: ".store.kv.CompactResponse"
          server_streaming: true
        }
      }
    }
  )pb", &files));
  return files;
}

TEST(CompilerTest, OneFilePerService) {
  MemorySink sink;
  ASSERT_TRUE(Compile(TwoServices(), GenerationOptions(), sink).ok());
  ASSERT_EQ(sink.files.size(), 2u);

  const std::string &kv = sink.files["kv_kv.rpc.h"];
  EXPECT_TRUE(absl::StrContains(kv, "class KvClient {"));
  EXPECT_TRUE(absl::StrContains(kv, "class KvServer {"));
  EXPECT_TRUE(absl::StrContains(kv, "\"/kv.Kv/Get\""));
  EXPECT_FALSE(absl::StrContains(kv, "Admin"));

  const std::string &admin = sink.files["kv_admin.rpc.h"];
  EXPECT_TRUE(absl::StrContains(admin, "class AdminClient {"));
  EXPECT_TRUE(absl::StrContains(admin, "::store::kv::CompactRequest"));
  EXPECT_FALSE(absl::StrContains(admin, "KvClient"));
}

TEST(CompilerTest, ModuleIndexListsServicesInOrder) {
  GenerationOptions options;
  options.module_index = "services.rpc.h";
  MemorySink sink;
  ASSERT_TRUE(Compile(TwoServices(), options, sink).ok());
  EXPECT_TRUE(absl::EndsWith(sink.files["services.rpc.h"],
                             "#include \"kv_kv.rpc.h\"\n"
                             "#include \"kv_admin.rpc.h\"\n"));
  EXPECT_EQ(sink.writes, 3);

  // Regenerating rewrites service files but leaves the unchanged index.
  ASSERT_TRUE(Compile(TwoServices(), options, sink).ok());
  EXPECT_EQ(sink.writes, 5);
}

TEST(CompilerTest, NoIndexByDefault) {
  MemorySink sink;
  ASSERT_TRUE(Compile(TwoServices(), GenerationOptions(), sink).ok());
  EXPECT_EQ(sink.files.count("services.rpc.h"), 0u);
}

TEST(CompilerTest, SchemaErrorWritesNothing) {
  protobuf::FileDescriptorSet files = TwoServices();
  files.mutable_file(0)->mutable_service(1)->mutable_method(0)->clear_name();
  MemorySink sink;
  absl::Status status = Compile(files, GenerationOptions(), sink);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(sink.writes, 0);
}

TEST(CompilerTest, CollidingFileNamesAreRejected) {
  protobuf::FileDescriptorSet files;
  ASSERT_TRUE(protobuf::TextFormat::ParseFromString(R"pb(
    file {
      name: "a.proto"
      package: "a.x"
      service {
        name: "Svc"
        method {
          name: "Get"
          input_type: ".a.x.Req"
          output_type: ".a.x.Resp"
        }
      }
    }
    file {
      name: "b.proto"
      package: "b.x"
      service {
        name: "Svc"
        method {
          name: "Put"
          input_type: ".b.x.Req"
          output_type: ".b.x.Resp"
        }
      }
    }
  )pb", &files));

  MemorySink sink;
  absl::Status status = Compile(files, GenerationOptions(), sink);
  EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
  EXPECT_TRUE(absl::StrContains(status.message(), "a.proto")) << status;
  EXPECT_TRUE(absl::StrContains(status.message(), "b.proto")) << status;
  EXPECT_TRUE(absl::StrContains(status.message(), "x_svc.rpc.h")) << status;
  EXPECT_EQ(sink.writes, 0);
}

TEST(CompilerTest, RoutesUseTheFlattenedPackage) {
  MemorySink sink;
  ASSERT_TRUE(Compile(TwoServices(), GenerationOptions(), sink).ok());
  const std::string &admin = sink.files["kv_admin.rpc.h"];
  EXPECT_TRUE(absl::StrContains(admin, "\"/kv.Admin/Compact\""));
  EXPECT_FALSE(absl::StrContains(admin, "/store.kv.Admin/"));
}

TEST(CompilerTest, OptionsReachTheOutput) {
  absl::StatusOr<GenerationOptions> options = GenerationOptions::Parse(
      "build_server=false,build_transport=false,file_name={service}");
  ASSERT_TRUE(options.ok()) << options.status();
  MemorySink sink;
  ASSERT_TRUE(Compile(TwoServices(), *options, sink).ok());

  const std::string &kv = sink.files["kv.rpc.h"];
  EXPECT_TRUE(absl::StrContains(kv, "class KvClient {"));
  EXPECT_FALSE(absl::StrContains(kv, "KvServer"));
  EXPECT_FALSE(absl::StrContains(kv, "Connect("));
  EXPECT_EQ(sink.files.count("admin.rpc.h"), 1u);
}

} // namespace
