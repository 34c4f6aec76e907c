#include "src/options.h"

#include <utility>

#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

namespace protorpc_generator {
namespace {

absl::Status ParseBool(absl::string_view key, absl::string_view value,
                       bool *out) {
  if (!absl::SimpleAtob(value, out)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "option ", key, " expects true or false, got \"", value, "\""));
  }
  return absl::OkStatus();
}

} // namespace

std::string DefaultFileName(absl::string_view package,
                            absl::string_view service) {
  return absl::StrCat(package, "_", service);
}

FileNameFn FileNameTemplate(std::string pattern) {
  return [pattern = std::move(pattern)](absl::string_view package,
                                        absl::string_view service) {
    return absl::StrReplaceAll(pattern,
                               {{"{package}", package}, {"{service}", service}});
  };
}

absl::StatusOr<GenerationOptions>
GenerationOptions::Parse(absl::string_view parameter) {
  GenerationOptions options;
  for (absl::string_view entry :
       absl::StrSplit(parameter, ',', absl::SkipWhitespace())) {
    std::pair<absl::string_view, absl::string_view> kv =
        absl::StrSplit(entry, absl::MaxSplits('=', 1));
    const absl::string_view key = absl::StripAsciiWhitespace(kv.first);
    const absl::string_view value = absl::StripAsciiWhitespace(kv.second);
    absl::Status status;
    if (key == "proto_path") {
      options.proto_path = std::string(value);
    } else if (key == "codec_path") {
      if (value.empty()) {
        return absl::InvalidArgumentError("option codec_path must not be empty");
      }
      options.codec_path = std::string(value);
    } else if (key == "file_name") {
      if (value.empty()) {
        return absl::InvalidArgumentError("option file_name must not be empty");
      }
      options.file_name = FileNameTemplate(std::string(value));
    } else if (key == "build_client") {
      status = ParseBool(key, value, &options.build_client);
    } else if (key == "build_server") {
      status = ParseBool(key, value, &options.build_server);
    } else if (key == "build_transport") {
      status = ParseBool(key, value, &options.build_transport);
    } else if (key == "out_dir") {
      options.out_dir = std::string(value);
    } else if (key == "module_index") {
      options.module_index = std::string(value);
    } else {
      return absl::InvalidArgumentError(
          absl::StrCat("unknown generator option \"", key, "\""));
    }
    if (!status.ok()) {
      return status;
    }
  }
  return options;
}

} // namespace protorpc_generator
