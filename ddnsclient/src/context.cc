// Copyright (c) 2025 <Your Name>
#include "ddnsclient/context.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>

#include "ddnsclient/telemetry.hpp"

namespace ddnsclient {

namespace internal {
struct CancelState {
  std::atomic<bool> cancelled{false};
  std::mutex mtx;
  std::condition_variable cv;
};
}  // namespace internal

Context::Context() = default;

bool Context::IsCancelled() const {
  return cancel_ && cancel_->cancelled.load(std::memory_order_acquire);
}

bool Context::WaitFor(std::chrono::milliseconds timeout) const {
  if (!cancel_) {
    if (timeout.count() > 0) std::this_thread::sleep_for(timeout);
    return false;
  }
  std::unique_lock<std::mutex> lk(cancel_->mtx);
  return cancel_->cv.wait_for(lk, timeout, [this]() {
    return cancel_->cancelled.load(std::memory_order_acquire);
  });
}

Context Context::WithSpan(std::shared_ptr<telemetry::Span> span) const {
  Context child(*this);
  child.span_ = std::move(span);
  return child;
}

CancelSource::CancelSource()
    : state_(std::make_shared<internal::CancelState>()) {}

void CancelSource::Cancel() {
  {
    std::lock_guard<std::mutex> lk(state_->mtx);
    state_->cancelled.store(true, std::memory_order_release);
  }
  state_->cv.notify_all();
}

bool CancelSource::IsCancelled() const {
  return state_->cancelled.load(std::memory_order_acquire);
}

Context CancelSource::GetContext() const {
  Context ctx;
  ctx.cancel_ = state_;
  return ctx;
}

}  // namespace ddnsclient
