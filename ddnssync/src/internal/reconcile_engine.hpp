// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief One reconcile pass: resolve the public IP, then update every host.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ddnsclient/context.hpp"
#include "ddnsclient/ip_resolver.hpp"
#include "ddnsclient/telemetry.hpp"
#include "ddnsclient/update_client.hpp"
#include "ddnssync/options.hpp"
#include "ddnssync/tick_result.hpp"

namespace ddnssync {
namespace internal {

/** Unit of work driven by the Scheduler. */
class Reconciler {
 public:
  virtual ~Reconciler() = default;
  virtual TickResult Execute(const ddnsclient::Context& ctx) = 0;
};

/**
 * @brief Resolve-once, update-all reconcile engine.
 *
 * Responsibilities
 * - Resolve the external IP exactly once per pass. On failure the pass is
 *   aborted and no update request is sent.
 * - Launch one thread per configured host (no cap, no short-circuit) using
 *   the resolved IP, then wait for all of them.
 * - Classify each response, report each host individually, and return an
 *   aggregate HostUpdate error if at least one host failed.
 * - Record the execution span and tick/host metrics.
 *
 * Execute() is not reentrant; the Scheduler calls it sequentially.
 */
class ReconcileEngine : public Reconciler {
 public:
  /**
   * @param resolver IP oracle (not owned).
   * @param client Provider client (not owned).
   * @param hosts Hosts to update, in configuration order.
   * @param opt Source of logger, tracer and meter.
   */
  ReconcileEngine(const ddnsclient::IpResolver* resolver,
                  const ddnsclient::UpdateClient* client,
                  std::vector<ddnsclient::Host> hosts, const Options& opt);

  TickResult Execute(const ddnsclient::Context& ctx) override;

  const std::vector<ddnsclient::Host>& Hosts() const { return hosts_; }

 private:
  void UpdateHost(const ddnsclient::Context& ctx, const std::string& ip,
                  HostResult* out);

  const ddnsclient::IpResolver* resolver_;  // not owned
  const ddnsclient::UpdateClient* client_;  // not owned
  std::vector<ddnsclient::Host> hosts_;

  std::shared_ptr<ddnsclient::telemetry::Logger> log_;
  std::shared_ptr<ddnsclient::telemetry::Tracer> tracer_;

  std::shared_ptr<ddnsclient::telemetry::Counter> count_;
  std::shared_ptr<ddnsclient::telemetry::Counter> errors_;
  std::shared_ptr<ddnsclient::telemetry::Histogram> latency_;
  std::shared_ptr<ddnsclient::telemetry::Counter> host_count_;
  std::shared_ptr<ddnsclient::telemetry::Counter> host_errors_;
};

}  // namespace internal
}  // namespace ddnssync
