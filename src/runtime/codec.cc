#include "src/runtime/codec.h"

#include <limits>

#include "absl/strings/str_cat.h"

namespace protorpc {

absl::Status FromDecodeError(const google::protobuf::MessageLite &item,
                             absl::string_view reason) {
  // Map protobuf parse errors to an INTERNAL status code, as per
  // https://github.com/grpc/grpc/blob/master/doc/statuscodes.md
  return absl::InternalError(
      absl::StrCat("failed to decode ", item.GetTypeName(), ": ", reason));
}

absl::Status ParseFrame(absl::string_view frame,
                        google::protobuf::MessageLite *item) {
  if (frame.size() >
      static_cast<size_t>(std::numeric_limits<int>::max())) {
    return FromDecodeError(*item, "frame exceeds the 2GB message limit");
  }
  if (!item->ParsePartialFromArray(frame.data(),
                                   static_cast<int>(frame.size()))) {
    return FromDecodeError(*item, "malformed or truncated input");
  }
  if (!item->IsInitialized()) {
    return FromDecodeError(
        *item, absl::StrCat("missing required fields: ",
                            item->InitializationErrorString()));
  }
  return absl::OkStatus();
}

} // namespace protorpc
