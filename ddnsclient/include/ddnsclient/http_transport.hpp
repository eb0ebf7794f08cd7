// Copyright (c) 2025 <Your Name>
/**
 * @file http_transport.hpp
 * @brief Minimal HTTP GET transport interface.
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "ddnsclient/context.hpp"

namespace ddnsclient {

/** Default User-Agent sent when none is configured. */
constexpr const char* kDefaultUserAgent = "ddnssync/1.0";
/** Default per-request timeout in milliseconds. */
constexpr int kDefaultTimeoutMs = 5000;

/**
 * @brief One GET request.
 *
 * Query parameters are kept unencoded; the transport encodes them. Basic
 * authentication is sent when `username` is non-empty.
 */
struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> query;
  std::string user_agent;
  std::string username;
  std::string password;
  int timeout_ms = kDefaultTimeoutMs;
};

struct HttpResponse {
  int status = 0;
  std::string body;
};

/**
 * @brief Thread-safe HTTP transport.
 *
 * A single instance is shared by every concurrent caller; implementations
 * must not require external locking.
 */
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  /**
   * @brief Perform a GET request.
   * @param ctx Cancellation is honoured while the transfer runs.
   * @param req Request description.
   * @param resp Receives status and body when a response arrived.
   * @param err Transport failure description (timeout, refused, cancelled).
   * @return true if an HTTP response was received (any status code).
   */
  virtual bool Get(const Context& ctx, const HttpRequest& req,
                   HttpResponse* resp, std::string* err) = 0;
};

}  // namespace ddnsclient
