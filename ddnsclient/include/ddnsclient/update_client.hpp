// Copyright (c) 2025 <Your Name>
/**
 * @file update_client.hpp
 * @brief DDNS provider update request (dyndns2-style /nic/update).
 */
#pragma once

#include <string>

#include "ddnsclient/context.hpp"
#include "ddnsclient/error.hpp"
#include "ddnsclient/http_transport.hpp"

namespace ddnsclient {

/** One DNS record to keep in sync. Identity is the hostname. */
struct Host {
  std::string hostname;
  std::string user;
  std::string password;

  bool operator==(const Host& o) const {
    return hostname == o.hostname && user == o.user && password == o.password;
  }
  bool operator!=(const Host& o) const { return !(*this == o); }
};

/**
 * @brief Issues the provider's update request for one host.
 *
 * Request shape:
 *   GET <kUpdateEndpoint>?hostname=<host>&myip=<ip>
 *   Authorization: Basic base64(user:password)
 *   User-Agent: <non-empty>
 *
 * Returns the raw transport result; interpretation is left to Classify().
 * Stateless apart from configuration; safe for concurrent use as long as the
 * transport is.
 */
class UpdateClient {
 public:
  static constexpr const char* kUpdateEndpoint =
      "https://domains.google.com/nic/update";

  /**
   * @param transport Shared transport (not owned, must outlive the client).
   * @param user_agent Empty selects kDefaultUserAgent; the provider rejects
   *        requests without one ("badagent").
   * @param timeout_ms Per-request timeout.
   */
  explicit UpdateClient(HttpTransport* transport,
                        std::string user_agent = kDefaultUserAgent,
                        int timeout_ms = kDefaultTimeoutMs);

  /**
   * @brief Push `ip` for `host`.
   * @param resp Receives status and body when the provider answered.
   * @param err Receives a HostUpdate error on transport failure.
   * @return true if an HTTP response was received (any status code).
   */
  bool Update(const Context& ctx, const Host& host, const std::string& ip,
              HttpResponse* resp, Error* err) const;

  /** Build the request Update() sends (exposed for inspection). */
  HttpRequest BuildRequest(const Host& host, const std::string& ip) const;

  const std::string& UserAgent() const { return user_agent_; }

 private:
  HttpTransport* transport_;  // not owned
  std::string user_agent_;
  int timeout_ms_;
};

}  // namespace ddnsclient
