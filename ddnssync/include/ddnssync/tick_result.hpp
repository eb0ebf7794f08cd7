// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Per-tick aggregate produced by the reconcile engine.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "ddnsclient/error.hpp"
#include "ddnsclient/result_classifier.hpp"
#include "ddnsclient/update_client.hpp"

namespace ddnssync {

/** Outcome of one host within a tick. */
struct HostResult {
  ddnsclient::Host host;
  ddnsclient::Outcome outcome;
  /** HostUpdate or ProtocolResponse when outcome is Failed, else None. */
  ddnsclient::Error error;
};

/**
 * @brief Result of one reconcile pass.
 *
 * `hosts` follows configuration order (one entry per configured host, even
 * for duplicates) regardless of the order in which updates completed. It is
 * empty when IP resolution failed.
 */
struct TickResult {
  std::string ip;
  std::vector<HostResult> hosts;
  ddnsclient::Error error;

  int FailureCount() const;

  friend std::ostream& operator<<(std::ostream& os, const TickResult& t);
};

}  // namespace ddnssync
