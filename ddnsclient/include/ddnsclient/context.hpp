// Copyright (c) 2025 <Your Name>
/**
 * @file context.hpp
 * @brief Cancellation signal and current-span handle threaded through calls.
 *
 * A Context is a cheap, copyable view. Copies share the cancellation state of
 * the CancelSource they came from; WithSpan() derives a context that carries
 * a different current span but the same cancellation state.
 */
#pragma once

#include <chrono>
#include <memory>

namespace ddnsclient {

namespace telemetry {
class Span;
}  // namespace telemetry

namespace internal {
struct CancelState;
}  // namespace internal

class Context {
 public:
  /** Background context: never cancelled, no current span. */
  Context();

  /** Returns true once the owning CancelSource has been cancelled. */
  bool IsCancelled() const;

  /**
   * @brief Block until the timeout elapses or the context is cancelled.
   * @param timeout Maximum time to wait.
   * @return true if cancelled (before or during the wait), false on timeout.
   */
  bool WaitFor(std::chrono::milliseconds timeout) const;

  /** Current span, or nullptr when none is attached. Not owned. */
  telemetry::Span* CurrentSpan() const { return span_.get(); }

  /** Derive a context carrying `span` as the current span. */
  Context WithSpan(std::shared_ptr<telemetry::Span> span) const;

 private:
  friend class CancelSource;

  std::shared_ptr<internal::CancelState> cancel_;
  std::shared_ptr<telemetry::Span> span_;
};

/**
 * @brief Owner of a cancellation signal.
 *
 * Cancel() is thread-safe, idempotent and wakes every WaitFor() in progress.
 */
class CancelSource {
 public:
  CancelSource();

  CancelSource(const CancelSource&) = delete;
  CancelSource& operator=(const CancelSource&) = delete;

  void Cancel();
  bool IsCancelled() const;

  /** Context bound to this source. */
  Context GetContext() const;

 private:
  std::shared_ptr<internal::CancelState> state_;
};

}  // namespace ddnsclient
