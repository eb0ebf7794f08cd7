// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Periodic driver for a Reconciler.
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "ddnsclient/context.hpp"
#include "ddnsclient/error.hpp"
#include "ddnsclient/telemetry.hpp"
#include "ddnssync/tick_result.hpp"
#include "internal/reconcile_engine.hpp"

namespace ddnssync {
namespace internal {

/**
 * @brief Run a Reconciler immediately and then once per interval.
 *
 * Ticks never overlap: the next wait starts only after the previous pass has
 * joined all of its host updates. A failed tick is logged and the loop keeps
 * going. Cancellation is observed while waiting; a pass already in flight
 * finishes (its requests see the same context and abort promptly).
 */
class Scheduler {
 public:
  using TickCallback = std::function<void(const TickResult&)>;

  /**
   * Arguments are checked here; see InitError().
   *
   * @param interval Time between the end of one tick and the next; must be
   *        positive.
   * @param reconciler Work to run each tick (not owned, not null).
   * @param log Logger for tick failures and shutdown.
   * @param on_tick Optional observer, called after every tick.
   */
  Scheduler(std::chrono::milliseconds interval, Reconciler* reconciler,
            std::shared_ptr<ddnsclient::telemetry::Logger> log,
            TickCallback on_tick = TickCallback());

  /**
   * @brief ErrorCode::Config when constructed with a non-positive interval
   *        or no reconciler; otherwise no error.
   */
  const ddnsclient::Error& InitError() const { return init_error_; }

  /**
   * @brief Loop until `ctx` is cancelled.
   * @return ErrorCode::Cancelled on shutdown, or InitError() without running
   *         any tick when construction failed.
   */
  ddnsclient::Error Run(const ddnsclient::Context& ctx);

  /** Number of completed ticks. */
  int Ticks() const { return ticks_; }

 private:
  std::chrono::milliseconds interval_;
  Reconciler* reconciler_;  // not owned
  std::shared_ptr<ddnsclient::telemetry::Logger> log_;
  TickCallback on_tick_;
  ddnsclient::Error init_error_;
  int ticks_ = 0;
};

}  // namespace internal
}  // namespace ddnssync
