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

#ifndef NET_PROTORPC_COMPILER_NAMING_H_
#define NET_PROTORPC_COMPILER_NAMING_H_

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace protorpc_generator {

/// Separator between namespace segments in a generated type reference.
inline constexpr absl::string_view kNamespaceSeparator = "::";

/// "GetClientStreaming" -> "get_client_streaming". Used for callables and
/// output module names.
std::string IdentifierCase(absl::string_view name);

/// "get_request" -> "GetRequest". Names that are already word-fused with
/// leading capitals, acronyms included, come back unchanged.
std::string TypeCase(absl::string_view name);

/// Escapes C++ keywords and leading digits so `name` can be declared.
std::string SafeIdentifier(absl::string_view name);

/**
 * The single namespace a package resolves to: its last dotted segment.
 * "package_1.package_2.package_3" -> "package_3".
 *
 * The flattened name is also the package part of route paths (see
 * FormatMethodPath()), and two packages ending in the same segment map to
 * the same namespace.
 */
std::string NamespaceOf(absl::string_view package);

/**
 * Resolves a dotted schema type path to a fully qualified reference under
 * `proto_root`: ".package.Message" -> "{proto_root}::package::Message".
 * Namespace segments are copied verbatim, the type name goes through
 * TypeCase, and the empty root segment of an absolute path is skipped.
 */
absl::StatusOr<std::string> QualifyType(absl::string_view path,
                                        absl::string_view proto_root);

/// "dir/debugpb.proto" -> "dir/debugpb".
std::string StripProto(absl::string_view file_name);

} // namespace protorpc_generator

#endif // NET_PROTORPC_COMPILER_NAMING_H_
