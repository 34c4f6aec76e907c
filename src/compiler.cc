#include "src/compiler.h"

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"

#include "src/rpc_generator.h"
#include "src/service_model.h"

namespace protorpc_generator {
namespace {

std::string Describe(const ServiceModel &service) {
  return absl::StrCat(service.identifier(), " (", service.source_file(), ")");
}

// Every service must own its output file. Checked before anything is
// written.
absl::Status CheckFileNames(const std::vector<ServiceModel> &services,
                            const OutputWriter &writer) {
  absl::flat_hash_map<std::string, const ServiceModel *> owners;
  for (const ServiceModel &service : services) {
    auto inserted = owners.emplace(writer.FileName(service), &service);
    if (!inserted.second) {
      return absl::InvalidArgumentError(absl::StrCat(
          "services ", Describe(*inserted.first->second), " and ",
          Describe(service), " both generate ", inserted.first->first));
    }
  }
  return absl::OkStatus();
}

} // namespace

absl::Status Compile(const google::protobuf::FileDescriptorSet &files,
                     const GenerationOptions &options, OutputSink &sink) {
  absl::StatusOr<std::vector<ServiceModel>> services =
      BuildServiceModels(files, options.codec_path);
  if (!services.ok()) {
    return services.status();
  }

  OutputWriter writer(options.file_name, &sink);
  absl::Status checked = CheckFileNames(*services, writer);
  if (!checked.ok()) {
    return checked;
  }
  ServiceGenerator generator(options);
  std::vector<std::string> generated;
  for (const ServiceModel &service : *services) {
    generator.Generate(service);
    std::string output;
    generator.Finalize(&output);
    absl::Status status = writer.Write(service, output);
    if (!status.ok()) {
      return status;
    }
    generated.push_back(writer.FileName(service));
  }

  if (!options.module_index.empty()) {
    absl::StatusOr<bool> written =
        writer.WriteIndex(options.module_index, RenderModuleIndex(generated));
    if (!written.ok()) {
      return written.status();
    }
  }
  return absl::OkStatus();
}

} // namespace protorpc_generator
