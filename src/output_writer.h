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

#ifndef NET_PROTORPC_COMPILER_OUTPUT_WRITER_H_
#define NET_PROTORPC_COMPILER_OUTPUT_WRITER_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

#include "src/options.h"
#include "src/rpc_generator.h"

namespace protorpc_generator {

/// Extension of every generated service file.
inline constexpr absl::string_view kGeneratedFileExtension = "rpc.h";

/// Where generated files go. Paths are relative to the sink's root.
class OutputSink {
public:
  virtual ~OutputSink() = default;

  /// Replaces the content of `path`.
  virtual absl::Status Write(absl::string_view path,
                             absl::string_view content) = 0;

  /// Current content of `path`, absl::nullopt when there is none or the sink
  /// cannot read back.
  virtual absl::StatusOr<absl::optional<std::string>>
  Read(absl::string_view path) = 0;
};

/// An OutputSink over a directory of the local filesystem. The directory
/// must exist.
class DirectorySink : public OutputSink {
public:
  explicit DirectorySink(std::string root) : root_(std::move(root)) {}

  absl::Status Write(absl::string_view path,
                     absl::string_view content) override;
  absl::StatusOr<absl::optional<std::string>>
  Read(absl::string_view path) override;

  std::string FullPath(absl::string_view path) const;

private:
  std::string root_;
};

/**
 * Names and writes the output of each service.
 *
 * A service goes to `{IdentifierCase(file_name(package, name))}.rpc.h`, one
 * file per service, overwritten unconditionally. The module index is the one
 * file written only when its content changes, so incremental builds are not
 * retriggered.
 */
class OutputWriter {
public:
  OutputWriter(FileNameFn file_name, OutputSink *sink)
      : file_name_(std::move(file_name)), sink_(sink) {}

  /// Module name of `service`'s output, without extension.
  std::string ModuleName(const Service &service) const;

  /// File name of `service`'s output.
  std::string FileName(const Service &service) const;

  absl::Status Write(const Service &service, absl::string_view content) const;

  /// Writes `content` to `name` unless it is already there. Returns whether
  /// the file was written.
  absl::StatusOr<bool> WriteIndex(absl::string_view name,
                                  absl::string_view content) const;

private:
  FileNameFn file_name_;
  OutputSink *sink_;
};

/// Umbrella header including each of `files`, in order.
std::string RenderModuleIndex(const std::vector<std::string> &files);

} // namespace protorpc_generator

#endif // NET_PROTORPC_COMPILER_OUTPUT_WRITER_H_
