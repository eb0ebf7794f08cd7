// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Dynamic DNS sync service.
 *
 * Binds a Config and Options into the resolve -> fan-out -> classify
 * pipeline and drives it on a fixed interval. The public IP is looked up
 * once per tick and pushed to every configured host concurrently.
 */
#pragma once

#include <memory>
#include <vector>

#include "ddnsclient/context.hpp"
#include "ddnsclient/error.hpp"
#include "ddnsclient/update_client.hpp"
#include "ddnssync/config.hpp"
#include "ddnssync/options.hpp"
#include "ddnssync/tick_result.hpp"

namespace ddnssync {

/**
 * @brief Periodic public-IP to DDNS reconciler.
 *
 * Either block in Run() with a caller-owned context, or control a
 * background loop with Start/Stop. Config is immutable after Create().
 */
class Service {
 public:
  /**
   * @brief Validate `config` and assemble the component graph.
   * @param config Interval and hosts (copied).
   * @param opt Immutable options snapshot. When Transport() is null a
   *        CurlTransport is created and owned by the service.
   * @param err Receives a ErrorCode::Config error on failure.
   * @return nullptr if validation fails.
   */
  static std::unique_ptr<Service> Create(const Config& config,
                                         const Options& opt, Error* err);
  ~Service();

  Service(const Service&) = delete;
  Service& operator=(const Service&) = delete;

  /** Configured hosts, in configuration order (duplicates kept). */
  const std::vector<ddnsclient::Host>& Hosts() const;
  const Config& GetConfig() const;
  Options GetOptions() const;

  /** Execute a single tick synchronously. */
  TickResult RunOnce(const ddnsclient::Context& ctx);

  /**
   * @brief Run ticks until `ctx` is cancelled.
   * @return ErrorCode::Cancelled on normal shutdown.
   */
  Error Run(const ddnsclient::Context& ctx);

  /**
   * @brief Start the loop on a background thread.
   * @return false if already running.
   */
  bool Start();
  /** Cancel the loop and wait for the in-flight tick to finish. */
  void Stop();
  bool IsRunning() const;

  /**
   * @brief Latest tick result.
   * @return false if no tick has completed yet.
   */
  bool GetLastTick(TickResult* out) const;

 private:
  Service();

  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace ddnssync
