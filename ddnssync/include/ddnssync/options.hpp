// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Immutable runtime options for the sync service.
 */
#pragma once

#include <memory>
#include <ostream>
#include <string>

#include "ddnsclient/http_transport.hpp"
#include "ddnsclient/telemetry.hpp"
#include "ddnssync/telemetry.hpp"

namespace ddnssync {

/**
 * @brief Immutable options for Service.
 *
 * Use the Builder to construct instances. Collaborators (logger, tracer,
 * meter, transport) are injected here instead of being process-wide globals.
 * After Build(), Logger(), Tracer() and Meter() are never null; Transport()
 * may be null, in which case the Service creates its own CurlTransport.
 */
class Options {
 public:
  using LogCallback = ddnssync::LogCallback;

  /**
   * @brief Fluent builder for Options.
   */
  class Builder {
   public:
    Builder();
    explicit Builder(const Options& base);

    /** User-Agent for all requests (default: "ddnssync/1.0"; empty keeps). */
    Builder& UserAgent(const std::string& v);
    /** IP-echo endpoint (default: "http://ifconfig.me/ip"; empty keeps). */
    Builder& IpEndpoint(const std::string& v);
    /** Per-request timeout in milliseconds (default: 5000, min 1). */
    Builder& RequestTimeoutMs(int v);
    /**
     * Plain line sink; wrapped in a ContextualLogger if no Logger is set.
     * On a builder derived from an Options, a new sink replaces the logger
     * that was built from the old one.
     */
    Builder& LogSink(LogCallback cb);
    /** Explicit logger; takes precedence over LogSink(). */
    Builder& Logger(std::shared_ptr<ddnsclient::telemetry::Logger> v);
    Builder& Tracer(std::shared_ptr<ddnsclient::telemetry::Tracer> v);
    Builder& Meter(std::shared_ptr<ddnsclient::telemetry::Meter> v);
    /** Shared HTTP transport (default: a CurlTransport owned by Service). */
    Builder& Transport(std::shared_ptr<ddnsclient::HttpTransport> v);

    Options Build() const;

   private:
    std::string user_agent_;
    std::string ip_endpoint_;
    int request_timeout_ms_;
    LogCallback log_sink_cb_;
    // Null unless Logger() was called (or inherited from an explicit one).
    std::shared_ptr<ddnsclient::telemetry::Logger> logger_;
    std::shared_ptr<ddnsclient::telemetry::Tracer> tracer_;
    std::shared_ptr<ddnsclient::telemetry::Meter> meter_;
    std::shared_ptr<ddnsclient::HttpTransport> transport_;
  };

  /** Defaults, equivalent to Builder().Build(). */
  Options();

  /** @name Getters (immutable) */
  ///@{
  const std::string& UserAgent() const { return user_agent_; }
  const std::string& IpEndpoint() const { return ip_endpoint_; }
  int RequestTimeoutMs() const { return request_timeout_ms_; }
  const LogCallback& LogSink() const { return log_sink_cb_; }
  const std::shared_ptr<ddnsclient::telemetry::Logger>& Logger() const {
    return logger_;
  }
  const std::shared_ptr<ddnsclient::telemetry::Tracer>& Tracer() const {
    return tracer_;
  }
  const std::shared_ptr<ddnsclient::telemetry::Meter>& Meter() const {
    return meter_;
  }
  const std::shared_ptr<ddnsclient::HttpTransport>& Transport() const {
    return transport_;
  }
  ///@}

  /** Stream formatter for logging. */
  friend std::ostream& operator<<(std::ostream& os, const Options& o);

 private:
  // Private ctor for Builder
  Options(std::string user_agent, std::string ip_endpoint,
          int request_timeout_ms, LogCallback log_sink,
          std::shared_ptr<ddnsclient::telemetry::Logger> logger,
          bool logger_set,
          std::shared_ptr<ddnsclient::telemetry::Tracer> tracer,
          std::shared_ptr<ddnsclient::telemetry::Meter> meter,
          std::shared_ptr<ddnsclient::HttpTransport> transport);

  std::string user_agent_;
  std::string ip_endpoint_;
  int request_timeout_ms_;
  LogCallback log_sink_cb_;
  std::shared_ptr<ddnsclient::telemetry::Logger> logger_;
  bool logger_set_;  // logger_ came from Builder::Logger(), not the sink
  std::shared_ptr<ddnsclient::telemetry::Tracer> tracer_;
  std::shared_ptr<ddnsclient::telemetry::Meter> meter_;
  std::shared_ptr<ddnsclient::HttpTransport> transport_;
};

}  // namespace ddnssync
