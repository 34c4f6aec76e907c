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

#ifndef NET_PROTORPC_RUNTIME_CLIENT_H_
#define NET_PROTORPC_RUNTIME_CLIENT_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

#include "src/runtime/channel.h"
#include "src/runtime/codec.h"

namespace protorpc {

/**
 * Typed client view of a Call. `Codec::Encode` is the request type and
 * `Codec::Decode` the response type; the codec is fixed when the bindings
 * are generated.
 */
template <typename Codec> class ClientStream {
public:
  using Request = typename Codec::Encode;
  using Response = typename Codec::Decode;

  ClientStream(std::unique_ptr<Call> call, Codec codec)
      : call_(std::move(call)), codec_(std::move(codec)) {}

  absl::Status Write(const Request &request) {
    if (call_ == nullptr) {
      return NoCall();
    }
    std::string frame;
    codec_.encoder().Encode(request, &frame);
    return call_->Write(std::move(frame));
  }

  absl::Status WritesDone() {
    if (call_ == nullptr) {
      return NoCall();
    }
    return call_->WritesDone();
  }

  /// Next response, absl::nullopt when the server has finished.
  absl::StatusOr<absl::optional<Response>> Read() {
    if (call_ == nullptr) {
      return NoCall();
    }
    absl::StatusOr<absl::optional<std::string>> frame = call_->Read();
    if (!frame.ok()) {
      return frame.status();
    }
    if (!frame->has_value()) {
      return codec_.decoder().Decode(DecodeBuf());
    }
    return codec_.decoder().Decode(DecodeBuf(**frame));
  }

  /// Half-closes and reads the single response of a unary or
  /// client-streaming call.
  absl::StatusOr<Response> Finish() {
    absl::Status status = WritesDone();
    if (!status.ok()) {
      return status;
    }
    absl::StatusOr<absl::optional<Response>> response = Read();
    if (!response.ok()) {
      return response.status();
    }
    if (!response->has_value()) {
      return absl::InternalError("Missing response message.");
    }
    return std::move(**response);
  }

private:
  static absl::Status NoCall() {
    return absl::UnavailableError("channel did not start the call");
  }

  std::unique_ptr<Call> call_;
  Codec codec_;
};

template <typename Codec>
ClientStream<Codec> StartCall(Channel &channel, absl::string_view path,
                              Codec codec) {
  return ClientStream<Codec>(channel.NewCall(path), std::move(codec));
}

template <typename Codec>
absl::StatusOr<typename Codec::Decode>
UnaryCall(Channel &channel, absl::string_view path,
          const typename Codec::Encode &request, Codec codec) {
  ClientStream<Codec> stream = StartCall(channel, path, std::move(codec));
  absl::Status status = stream.Write(request);
  if (!status.ok()) {
    return status;
  }
  return stream.Finish();
}

/// Sends the single request and half-closes; the caller reads responses
/// from the returned stream until it yields absl::nullopt.
template <typename Codec>
absl::StatusOr<ClientStream<Codec>>
ServerStreamingCall(Channel &channel, absl::string_view path,
                    const typename Codec::Encode &request, Codec codec) {
  ClientStream<Codec> stream = StartCall(channel, path, std::move(codec));
  absl::Status status = stream.Write(request);
  if (!status.ok()) {
    return status;
  }
  status = stream.WritesDone();
  if (!status.ok()) {
    return status;
  }
  return std::move(stream);
}

} // namespace protorpc

#endif // NET_PROTORPC_RUNTIME_CLIENT_H_
