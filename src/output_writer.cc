#include "src/output_writer.h"

#include <fstream>
#include <sstream>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

#include "src/naming.h"

namespace protorpc_generator {

std::string DirectorySink::FullPath(absl::string_view path) const {
  if (root_.empty()) {
    return std::string(path);
  }
  if (absl::EndsWith(root_, "/")) {
    return absl::StrCat(root_, path);
  }
  return absl::StrCat(root_, "/", path);
}

absl::Status DirectorySink::Write(absl::string_view path,
                                  absl::string_view content) {
  const std::string full_path = FullPath(path);
  std::ofstream out(full_path,
                    std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    return absl::UnavailableError(
        absl::StrCat("cannot open ", full_path, " for writing"));
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (out.fail()) {
    return absl::DataLossError(absl::StrCat("failed to write ", full_path));
  }
  return absl::OkStatus();
}

absl::StatusOr<absl::optional<std::string>>
DirectorySink::Read(absl::string_view path) {
  const std::string full_path = FullPath(path);
  std::ifstream in(full_path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return absl::optional<std::string>();
  }
  std::ostringstream content;
  content << in.rdbuf();
  if (in.bad()) {
    return absl::DataLossError(absl::StrCat("failed to read ", full_path));
  }
  return absl::optional<std::string>(content.str());
}

std::string OutputWriter::ModuleName(const Service &service) const {
  return IdentifierCase(file_name_(service.package(), service.name()));
}

std::string OutputWriter::FileName(const Service &service) const {
  return absl::StrCat(ModuleName(service), ".", kGeneratedFileExtension);
}

absl::Status OutputWriter::Write(const Service &service,
                                 absl::string_view content) const {
  const std::string module = ModuleName(service);
  if (module.empty()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "file name for service ", service.identifier(), " is empty"));
  }
  return sink_->Write(absl::StrCat(module, ".", kGeneratedFileExtension),
                      content);
}

absl::StatusOr<bool> OutputWriter::WriteIndex(absl::string_view name,
                                              absl::string_view content) const {
  absl::StatusOr<absl::optional<std::string>> previous = sink_->Read(name);
  if (!previous.ok()) {
    return previous.status();
  }
  if (previous->has_value() && **previous == content) {
    return false;
  }
  absl::Status status = sink_->Write(name, content);
  if (!status.ok()) {
    return status;
  }
  return true;
}

std::string RenderModuleIndex(const std::vector<std::string> &files) {
  std::string index = "// Generated by protoc-gen-protorpc. DO NOT EDIT!\n"
                      "\n"
                      "#pragma once\n"
                      "\n";
  for (const std::string &file : files) {
    absl::StrAppend(&index, "#include \"", file, "\"\n");
  }
  return index;
}

} // namespace protorpc_generator
