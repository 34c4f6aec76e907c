#include <memory>
#include <string>
#include <vector>

#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include <google/protobuf/compiler/code_generator.h>
#include <google/protobuf/compiler/plugin.h>
#include <google/protobuf/descriptor.h>
#include <google/protobuf/descriptor.pb.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream.h>

#include "src/compiler.h"
#include "src/options.h"
#include "src/output_writer.h"

namespace protobuf = google::protobuf;

namespace {

// Output goes through protoc, which cannot hand back what a previous run
// wrote, so every file, the module index included, is written.
class GeneratorContextSink : public protorpc_generator::OutputSink {
public:
  explicit GeneratorContextSink(protobuf::compiler::GeneratorContext *context)
      : context_(context) {}

  absl::Status Write(absl::string_view path,
                     absl::string_view content) override {
    auto outfile = absl::WrapUnique(context_->Open(std::string(path)));
    protobuf::io::CodedOutputStream coded(outfile.get());
    coded.WriteRaw(content.data(), static_cast<int>(content.size()));
    if (coded.HadError()) {
      return absl::DataLossError(absl::StrCat("failed to write ", path));
    }
    return absl::OkStatus();
  }

  absl::StatusOr<absl::optional<std::string>>
  Read(absl::string_view /*path*/) override {
    return absl::optional<std::string>();
  }

private:
  protobuf::compiler::GeneratorContext *context_;
};

} // namespace

class RpcGenerator : public protobuf::compiler::CodeGenerator {
public:
  // Protobuf 5.27 released edition 2023.
#if GOOGLE_PROTOBUF_VERSION >= 5027000
  uint64_t GetSupportedFeatures() const override {
    return Feature::FEATURE_PROTO3_OPTIONAL |
           Feature::FEATURE_SUPPORTS_EDITIONS;
  }
  protobuf::Edition GetMinimumEdition() const override {
    return protobuf::Edition::EDITION_PROTO2;
  }
  protobuf::Edition GetMaximumEdition() const override {
    return protobuf::Edition::EDITION_2023;
  }
#else
  uint64_t GetSupportedFeatures() const override {
    return Feature::FEATURE_PROTO3_OPTIONAL;
  }
#endif

  bool Generate(const protobuf::FileDescriptor *file,
                const std::string &parameter,
                protobuf::compiler::GeneratorContext *context,
                std::string *error) const override {
    return GenerateAll({file}, parameter, context, error);
  }

  // All files of one protoc run are compiled together so the module index
  // lists every service.
  bool GenerateAll(const std::vector<const protobuf::FileDescriptor *> &files,
                   const std::string &parameter,
                   protobuf::compiler::GeneratorContext *context,
                   std::string *error) const override {
    absl::StatusOr<protorpc_generator::GenerationOptions> opts =
        protorpc_generator::GenerationOptions::Parse(parameter);
    if (!opts.ok()) {
      *error = std::string(opts.status().message());
      return false;
    }

    protobuf::FileDescriptorSet descriptor_set;
    for (const protobuf::FileDescriptor *file : files) {
      protobuf::FileDescriptorProto *proto = descriptor_set.add_file();
      file->CopyTo(proto);
      file->CopySourceCodeInfoTo(proto);
    }

    GeneratorContextSink sink(context);
    absl::Status status =
        protorpc_generator::Compile(descriptor_set, *opts, sink);
    if (!status.ok()) {
      *error = std::string(status.message());
      return false;
    }
    return true;
  }
};

int main(int argc, char *argv[]) {
  RpcGenerator generator;
  return protobuf::compiler::PluginMain(argc, argv, &generator);
}
