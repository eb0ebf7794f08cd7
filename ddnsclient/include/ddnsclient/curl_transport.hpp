// Copyright (c) 2025 <Your Name>
/**
 * @file curl_transport.hpp
 * @brief libcurl-backed HttpTransport with a shared connection pool.
 */
#pragma once

#include <memory>
#include <string>

#include "ddnsclient/http_transport.hpp"

namespace ddnsclient {

/**
 * @brief HttpTransport implementation on top of libcurl's easy interface.
 *
 * Responsibilities
 * - Keep a pool of idle easy handles; each one retains its live connections,
 *   so sequential and concurrent requests reuse connections across ticks.
 * - Share DNS and TLS session caches between all handles (curl share API).
 * - Abort a running transfer when the caller's Context is cancelled.
 * - Never follow redirects; a 3xx is returned to the caller as-is.
 *
 * Thread-safe: Get() may be called concurrently from any number of threads.
 */
class CurlTransport : public HttpTransport {
 public:
  CurlTransport();
  ~CurlTransport() override;

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  bool Get(const Context& ctx, const HttpRequest& req, HttpResponse* resp,
           std::string* err) override;

  /** Number of idle handles currently kept for reuse. */
  size_t IdleHandles() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace ddnsclient
