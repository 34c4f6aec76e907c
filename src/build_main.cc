#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include <google/protobuf/descriptor.pb.h>

#include "src/compiler.h"
#include "src/options.h"
#include "src/output_writer.h"

ABSL_FLAG(std::string, descriptor_set, "",
          "FileDescriptorSet written by protoc --descriptor_set_out.");
ABSL_FLAG(std::string, out_dir, "",
          "Directory receiving the generated files. Defaults to $OUT_DIR.");
ABSL_FLAG(std::string, options, "",
          "Generator options as key=value pairs separated by commas, the "
          "same as the protoc plugin parameter.");

namespace {

namespace protobuf = google::protobuf;

absl::Status Run() {
  const std::string descriptor_path = absl::GetFlag(FLAGS_descriptor_set);
  if (descriptor_path.empty()) {
    return absl::InvalidArgumentError("--descriptor_set is required");
  }
  absl::StatusOr<protorpc_generator::GenerationOptions> options =
      protorpc_generator::GenerationOptions::Parse(absl::GetFlag(FLAGS_options));
  if (!options.ok()) {
    return options.status();
  }
  if (!absl::GetFlag(FLAGS_out_dir).empty()) {
    options->out_dir = absl::GetFlag(FLAGS_out_dir);
  }
  if (options->out_dir.empty()) {
    const char *out_dir = std::getenv("OUT_DIR");
    if (out_dir == nullptr || *out_dir == '\0') {
      return absl::InvalidArgumentError(
          "no output directory: pass --out_dir or set OUT_DIR");
    }
    options->out_dir = out_dir;
  }

  std::ifstream in(descriptor_path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return absl::NotFoundError(absl::StrCat("cannot open ", descriptor_path));
  }
  protobuf::FileDescriptorSet descriptor_set;
  if (!descriptor_set.ParseFromIstream(&in)) {
    return absl::InvalidArgumentError(
        absl::StrCat(descriptor_path, " is not a FileDescriptorSet"));
  }

  protorpc_generator::DirectorySink sink(options->out_dir);
  return protorpc_generator::Compile(descriptor_set, *options, sink);
}

} // namespace

int main(int argc, char *argv[]) {
  absl::SetProgramUsageMessage(
      "Generates RPC client and server bindings from a protobuf descriptor "
      "set.");
  absl::ParseCommandLine(argc, argv);
  absl::Status status = Run();
  if (!status.ok()) {
    std::cerr << "protorpc-build: " << status << std::endl;
    return 1;
  }
  return 0;
}
