#include "src/runtime/server.h"

#include "absl/strings/str_cat.h"

namespace protorpc {

absl::Status Router::AddRoute(std::string path, Handler handler) {
  if (!handler) {
    return absl::InvalidArgumentError(
        absl::StrCat("no handler given for route ", path));
  }
  auto inserted = routes_.emplace(path, std::move(handler));
  if (!inserted.second) {
    return absl::AlreadyExistsError(
        absl::StrCat("route ", path, " is already registered"));
  }
  return absl::OkStatus();
}

bool Router::HasRoute(absl::string_view path) const {
  return routes_.contains(path);
}

absl::Status Router::Dispatch(absl::string_view path, ServerCall &call) const {
  auto it = routes_.find(path);
  if (it == routes_.end()) {
    return absl::UnimplementedError(absl::StrCat("unknown route ", path));
  }
  return it->second(call);
}

} // namespace protorpc
