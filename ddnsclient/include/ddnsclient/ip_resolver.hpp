// Copyright (c) 2025 <Your Name>
/**
 * @file ip_resolver.hpp
 * @brief External (public) IP discovery through an IP-echo service.
 */
#pragma once

#include <string>

#include "ddnsclient/context.hpp"
#include "ddnsclient/error.hpp"
#include "ddnsclient/http_transport.hpp"

namespace ddnsclient {

/**
 * @brief Pure external-IP oracle.
 *
 * Issues exactly one GET per Resolve() call, without retry. Accepts either a
 * bare address (surrounding whitespace is trimmed) or a JSON object with an
 * "ip" member. Knows nothing about hosts or credentials.
 */
class IpResolver {
 public:
  static constexpr const char* kDefaultEndpoint = "http://ifconfig.me/ip";

  /**
   * @param transport Shared transport (not owned, must outlive the resolver).
   * @param endpoint IP-echo URL.
   * @param user_agent User-Agent header; empty selects kDefaultUserAgent.
   * @param timeout_ms Per-request timeout.
   */
  explicit IpResolver(HttpTransport* transport,
                      std::string endpoint = kDefaultEndpoint,
                      std::string user_agent = kDefaultUserAgent,
                      int timeout_ms = kDefaultTimeoutMs);

  /**
   * @brief Look up the caller's public address.
   * @param ctx Caller context (cancellation).
   * @param ip Receives the address on success.
   * @param err Receives an IpResolution error on failure.
   * @return true on success.
   */
  bool Resolve(const Context& ctx, std::string* ip, Error* err) const;

  const std::string& Endpoint() const { return endpoint_; }

 private:
  HttpTransport* transport_;  // not owned
  std::string endpoint_;
  std::string user_agent_;
  int timeout_ms_;
};

/**
 * @brief Extract an address from an IP-echo response body.
 *
 * Handles plain text and {"ip": "..."} bodies.
 * @return true if the result is a valid IPv4 or IPv6 literal.
 */
bool ParseIpResponse(const std::string& body, std::string* ip,
                     std::string* err);

/** Returns true for a textual IPv4 or IPv6 address. */
bool IsIpLiteral(const std::string& s);

}  // namespace ddnsclient
