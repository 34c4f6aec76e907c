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

#ifndef NET_PROTORPC_RUNTIME_SERVER_H_
#define NET_PROTORPC_RUNTIME_SERVER_H_

#include <functional>
#include <string>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

#include "src/runtime/codec.h"

namespace protorpc {

/// Server side of one RPC, implemented by the transport.
class ServerCall {
public:
  virtual ~ServerCall() = default;

  /// Next request frame, absl::nullopt once the client half-closed.
  virtual absl::StatusOr<absl::optional<std::string>> Read() = 0;

  virtual absl::Status Write(std::string frame) = 0;
};

/// Runs one call to completion. The returned status is the call's status.
using Handler = std::function<absl::Status(ServerCall &)>;

/// Maps route paths ("/package.Service/Method") to handlers.
class Router {
public:
  /// Fails with ALREADY_EXISTS when `path` is already routed.
  absl::Status AddRoute(std::string path, Handler handler);

  bool HasRoute(absl::string_view path) const;

  /// Runs the handler for `path`, UNIMPLEMENTED when there is none.
  absl::Status Dispatch(absl::string_view path, ServerCall &call) const;

private:
  absl::flat_hash_map<std::string, Handler> routes_;
};

/**
 * Typed server view of a ServerCall. `Codec::Decode` is the request type and
 * `Codec::Encode` the response type.
 */
template <typename Codec> class ServerStream {
public:
  using Request = typename Codec::Decode;
  using Response = typename Codec::Encode;

  ServerStream(ServerCall &call, Codec codec)
      : call_(call), codec_(std::move(codec)) {}

  /// Next request, absl::nullopt when the client has finished sending.
  absl::StatusOr<absl::optional<Request>> Read() {
    absl::StatusOr<absl::optional<std::string>> frame = call_.Read();
    if (!frame.ok()) {
      return frame.status();
    }
    if (!frame->has_value()) {
      return codec_.decoder().Decode(DecodeBuf());
    }
    return codec_.decoder().Decode(DecodeBuf(**frame));
  }

  absl::Status Write(const Response &response) {
    std::string frame;
    codec_.encoder().Encode(response, &frame);
    return call_.Write(std::move(frame));
  }

  /// Reads the request of a unary or server-streaming call.
  absl::StatusOr<Request> ReadSingle() {
    absl::StatusOr<absl::optional<Request>> request = Read();
    if (!request.ok()) {
      return request.status();
    }
    if (!request->has_value()) {
      return absl::InternalError("Missing request message.");
    }
    return std::move(**request);
  }

private:
  ServerCall &call_;
  Codec codec_;
};

template <typename Codec, typename Fn>
absl::Status ServeUnary(ServerCall &call, Codec codec, Fn &&fn) {
  ServerStream<Codec> stream(call, std::move(codec));
  absl::StatusOr<typename Codec::Decode> request = stream.ReadSingle();
  if (!request.ok()) {
    return request.status();
  }
  absl::StatusOr<typename Codec::Encode> response = fn(*request);
  if (!response.ok()) {
    return response.status();
  }
  return stream.Write(*response);
}

template <typename Codec, typename Fn>
absl::Status ServeClientStreaming(ServerCall &call, Codec codec, Fn &&fn) {
  ServerStream<Codec> stream(call, std::move(codec));
  absl::StatusOr<typename Codec::Encode> response = fn(stream);
  if (!response.ok()) {
    return response.status();
  }
  return stream.Write(*response);
}

template <typename Codec, typename Fn>
absl::Status ServeServerStreaming(ServerCall &call, Codec codec, Fn &&fn) {
  ServerStream<Codec> stream(call, std::move(codec));
  absl::StatusOr<typename Codec::Decode> request = stream.ReadSingle();
  if (!request.ok()) {
    return request.status();
  }
  return fn(*request, stream);
}

template <typename Codec, typename Fn>
absl::Status ServeBidiStreaming(ServerCall &call, Codec codec, Fn &&fn) {
  ServerStream<Codec> stream(call, std::move(codec));
  return fn(stream);
}

} // namespace protorpc

#endif // NET_PROTORPC_RUNTIME_SERVER_H_
