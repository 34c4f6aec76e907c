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

#ifndef NET_PROTORPC_RUNTIME_CHANNEL_H_
#define NET_PROTORPC_RUNTIME_CHANNEL_H_

#include <functional>
#include <memory>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace protorpc {

/**
 * Client side of one RPC as seen by the generated bindings.
 *
 * Implemented by the transport. Every frame is exactly one encoded message;
 * length prefixing, multiplexing and flow control stay inside the transport.
 */
class Call {
public:
  virtual ~Call() = default;

  virtual absl::Status Write(std::string frame) = 0;

  /// Half-closes the request side.
  virtual absl::Status WritesDone() = 0;

  /// Next response frame, absl::nullopt once the server finished with OK,
  /// or the status the server finished with.
  virtual absl::StatusOr<absl::optional<std::string>> Read() = 0;
};

/// A connection to one server that can start calls by route path.
class Channel {
public:
  virtual ~Channel() = default;

  virtual std::unique_ptr<Call> NewCall(absl::string_view path) = 0;
};

using ChannelFactory = std::function<absl::StatusOr<std::shared_ptr<Channel>>(
    absl::string_view target)>;

/// Installs the process-wide factory used by Connect(). Passing an empty
/// function uninstalls it.
void SetChannelFactory(ChannelFactory factory);

/// Opens a channel to `target` through the installed factory.
absl::StatusOr<std::shared_ptr<Channel>> Connect(absl::string_view target);

} // namespace protorpc

#endif // NET_PROTORPC_RUNTIME_CHANNEL_H_
