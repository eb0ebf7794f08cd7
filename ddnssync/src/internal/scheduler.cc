// Copyright (c) 2025 <Your Name>
#include "internal/scheduler.hpp"

#include <utility>

using ddnsclient::Error;
using ddnsclient::ErrorCode;

namespace ddnssync {
namespace internal {

Scheduler::Scheduler(std::chrono::milliseconds interval,
                     Reconciler* reconciler,
                     std::shared_ptr<ddnsclient::telemetry::Logger> log,
                     TickCallback on_tick)
    : interval_(interval),
      reconciler_(reconciler),
      log_(log ? std::move(log) : ddnsclient::telemetry::NullLogger()),
      on_tick_(std::move(on_tick)) {
  if (interval_.count() <= 0) {
    init_error_ =
        Error(ErrorCode::Config, "interval must be greater than zero");
  } else if (reconciler_ == nullptr) {
    init_error_ = Error(ErrorCode::Config, "no reconciler");
  }
}

Error Scheduler::Run(const ddnsclient::Context& ctx) {
  if (init_error_.Failed()) return init_error_;

  for (;;) {
    TickResult result = reconciler_->Execute(ctx);
    ++ticks_;
    if (result.error.Failed()) {
      log_->Error(ctx, "Failed to ping DNS service",
                  {{"error", result.error.message}});
    }
    if (on_tick_) on_tick_(result);

    if (ctx.WaitFor(interval_)) {
      log_->Info(ctx, "Stopping scheduler");
      return Error(ErrorCode::Cancelled, "context canceled");
    }
  }
}

}  // namespace internal
}  // namespace ddnssync
