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

#ifndef NET_PROTORPC_COMPILER_OPTIONS_H_
#define NET_PROTORPC_COMPILER_OPTIONS_H_

#include <functional>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace protorpc_generator {

/// Computes the base name (no extension) of a service's output file from its
/// package and service name. Must be free of side effects.
using FileNameFn =
    std::function<std::string(absl::string_view package, absl::string_view service)>;

/// "{package}_{service}".
std::string DefaultFileName(absl::string_view package,
                            absl::string_view service);

/// A FileNameFn that substitutes `{package}` and `{service}` in `pattern`.
FileNameFn FileNameTemplate(std::string pattern);

struct GenerationOptions {
  /// Namespace root prepended to every message type reference. Empty means
  /// the global namespace, so references come out as "::package::Message".
  std::string proto_path;

  /// Codec class template instantiated as `{codec_path}<Encode, Decode>`
  /// wherever generated code needs a codec.
  std::string codec_path = "::protorpc::ProtobufCodec";

  FileNameFn file_name = DefaultFileName;

  bool build_client = true;
  bool build_server = true;

  /// Adds the Connect() convenience factory to generated clients.
  bool build_transport = true;

  /// Destination directory. Empty means $OUT_DIR.
  std::string out_dir;

  /// Name of the umbrella header including every generated service header.
  /// Empty means no index is written.
  std::string module_index;

  /**
   * Parses a protoc generator parameter: comma separated `key=value` pairs
   * with keys proto_path, codec_path, file_name (a template over {package}
   * and {service}), build_client, build_server, build_transport, out_dir and
   * module_index. Unset keys keep their defaults.
   */
  static absl::StatusOr<GenerationOptions> Parse(absl::string_view parameter);
};

} // namespace protorpc_generator

#endif // NET_PROTORPC_COMPILER_OPTIONS_H_
