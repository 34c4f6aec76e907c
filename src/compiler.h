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

#ifndef NET_PROTORPC_COMPILER_COMPILER_H_
#define NET_PROTORPC_COMPILER_COMPILER_H_

#include "absl/status/status.h"
#include <google/protobuf/descriptor.pb.h>

#include "src/options.h"
#include "src/output_writer.h"

namespace protorpc_generator {

/**
 * Generates bindings for every service in `files` into `sink`.
 *
 * One file per service, flushed before the next service is generated, then
 * the module index if `options.module_index` is set. Stops at the first
 * error; files already written are left as they are and must not be used.
 */
absl::Status Compile(const google::protobuf::FileDescriptorSet &files,
                     const GenerationOptions &options, OutputSink &sink);

} // namespace protorpc_generator

#endif // NET_PROTORPC_COMPILER_COMPILER_H_
