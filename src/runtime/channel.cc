#include "src/runtime/channel.h"

#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/strings/str_cat.h"
#include "absl/synchronization/mutex.h"

namespace protorpc {
namespace {

ABSL_CONST_INIT absl::Mutex factory_mu(absl::kConstInit);
ChannelFactory *channel_factory ABSL_GUARDED_BY(factory_mu) = nullptr;

} // namespace

void SetChannelFactory(ChannelFactory factory) {
  ChannelFactory *installed =
      factory ? new ChannelFactory(std::move(factory)) : nullptr;
  ChannelFactory *previous;
  {
    absl::MutexLock lock(&factory_mu);
    previous = channel_factory;
    channel_factory = installed;
  }
  delete previous;
}

absl::StatusOr<std::shared_ptr<Channel>> Connect(absl::string_view target) {
  if (target.empty()) {
    return absl::InvalidArgumentError("connect target must not be empty");
  }
  ChannelFactory factory;
  {
    absl::MutexLock lock(&factory_mu);
    if (channel_factory != nullptr) {
      factory = *channel_factory;
    }
  }
  if (!factory) {
    return absl::FailedPreconditionError(absl::StrCat(
        "no transport installed to connect to \"", target,
        "\"; call protorpc::SetChannelFactory first"));
  }
  absl::StatusOr<std::shared_ptr<Channel>> channel = factory(target);
  if (channel.ok() && *channel == nullptr) {
    return absl::InternalError(
        absl::StrCat("transport returned no channel for \"", target, "\""));
  }
  return channel;
}

} // namespace protorpc
