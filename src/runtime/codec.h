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

#ifndef NET_PROTORPC_RUNTIME_CODEC_H_
#define NET_PROTORPC_RUNTIME_CODEC_H_

#include <string>
#include <type_traits>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include <google/protobuf/message_lite.h>

#include "src/runtime/check.h"

namespace protorpc {

/**
 * The payload of a single message as handed over by the transport.
 *
 * A default constructed buffer carries no frame at all: the stream has ended
 * and there is nothing to decode. A buffer built from a string_view carries
 * exactly one already-delimited message, which may be zero bytes long.
 */
class DecodeBuf {
public:
  DecodeBuf() : has_frame_(false) {}
  explicit DecodeBuf(absl::string_view frame)
      : frame_(frame), has_frame_(true) {}

  bool has_frame() const { return has_frame_; }
  absl::string_view frame() const { return frame_; }

private:
  absl::string_view frame_;
  bool has_frame_;
};

/// Builds the status reported for a message that failed to parse. Always of
/// kind INTERNAL: a well-formed peer never sends undecodable bytes.
absl::Status FromDecodeError(const google::protobuf::MessageLite &item,
                             absl::string_view reason);

/// Parses one frame into `item`. Returns OK or the INTERNAL decode error.
absl::Status ParseFrame(absl::string_view frame,
                        google::protobuf::MessageLite *item);

/// An encoder that knows how to encode `T`.
template <typename T> class ProtobufEncoder {
public:
  using Item = T;

  /// Appends the canonical encoding of `item` to `buf`. `item` must have all
  /// required fields set; a message that is not initialized, or running out
  /// of space, aborts.
  void Encode(const T &item, std::string *buf) const {
    PROTORPC_CHECK(item.IsInitialized())
        << "Cannot encode " << item.GetTypeName()
        << " with missing required fields: "
        << item.InitializationErrorString();
    PROTORPC_CHECK(item.AppendPartialToString(buf))
        << "Message only fails to encode if there is not enough space: "
        << item.GetTypeName();
  }
};

/// A decoder that knows how to decode `U`.
template <typename U> class ProtobufDecoder {
public:
  using Item = U;

  /// Returns absl::nullopt when `buf` carries no frame.
  absl::StatusOr<absl::optional<U>> Decode(const DecodeBuf &buf) const {
    if (!buf.has_frame()) {
      return absl::optional<U>();
    }
    U item;
    absl::Status status = ParseFrame(buf.frame(), &item);
    if (!status.ok()) {
      return status;
    }
    return absl::optional<U>(std::move(item));
  }
};

/**
 * A codec that implements `application/grpc+proto` over the protobuf
 * runtime. Encodes `T` and decodes `U`; carries no state, so instances are
 * free to construct and safe to share between threads.
 */
template <typename T, typename U> class ProtobufCodec {
  static_assert(std::is_base_of<google::protobuf::MessageLite, T>::value,
                "ProtobufCodec encodes protobuf messages only");
  static_assert(std::is_base_of<google::protobuf::MessageLite, U>::value,
                "ProtobufCodec decodes protobuf messages only");

public:
  using Encode = T;
  using Decode = U;
  using Encoder = ProtobufEncoder<T>;
  using Decoder = ProtobufDecoder<U>;

  Encoder encoder() const { return Encoder(); }
  Decoder decoder() const { return Decoder(); }
};

} // namespace protorpc

#endif // NET_PROTORPC_RUNTIME_CODEC_H_
