// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Service configuration: check interval and the hosts to keep in sync.
 *
 * File format (JSON):
 * @code
 * {
 *   "interval": "5m",
 *   "hosts": [
 *     {"host": "home.example.com", "user": "u", "password": "p"}
 *   ]
 * }
 * @endcode
 * `interval` is either a number of seconds or a duration string made of
 * `<number><unit>` groups with units ms, s, m, h (e.g. "1h30m").
 */
#pragma once

#include <chrono>
#include <ostream>
#include <string>
#include <vector>

#include "ddnsclient/error.hpp"
#include "ddnsclient/update_client.hpp"

namespace ddnssync {

using ddnsclient::Error;
using ddnsclient::ErrorCode;
using ddnsclient::Host;

/** Longest accepted check interval. */
constexpr std::chrono::hours kMaxInterval{24 * 365};

/** Loaded once at startup; immutable afterwards. */
struct Config {
  std::chrono::milliseconds interval{0};
  std::vector<Host> hosts;  ///< Ordered; duplicates are kept

  /** Stream formatter for logging (passwords are redacted). */
  friend std::ostream& operator<<(std::ostream& os, const Config& c);
};

/**
 * @brief Parse a duration such as "90s", "1h30m", "250ms".
 * @return false with a message in `err` for malformed input or a duration
 *         longer than kMaxInterval.
 */
bool ParseDuration(const std::string& text, std::chrono::milliseconds* out,
                   std::string* err);

/**
 * @brief Check interval and credentials.
 *
 * Rejects a non-positive interval or one above kMaxInterval, an empty host
 * list and any host with an empty hostname, user or password.
 */
bool ValidateConfig(const Config& config, Error* err);

/** Parse and validate a JSON document. Failures are ErrorCode::Config. */
bool ParseConfig(const std::string& text, Config* out, Error* err);

/** Read `path` and ParseConfig() its contents. */
bool LoadConfig(const std::string& path, Config* out, Error* err);

}  // namespace ddnssync
