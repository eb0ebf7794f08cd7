// Copyright (c) 2025 <Your Name>
#include "ddnssync/options.hpp"

#include <algorithm>
#include <utility>

#include "ddnsclient/ip_resolver.hpp"

// ---------------- Options::Builder ----------------
ddnssync::Options::Builder::Builder()
    : user_agent_(ddnsclient::kDefaultUserAgent),
      ip_endpoint_(ddnsclient::IpResolver::kDefaultEndpoint),
      request_timeout_ms_(ddnsclient::kDefaultTimeoutMs) {}

ddnssync::Options::Builder::Builder(const Options& base)
    : user_agent_(base.UserAgent()),
      ip_endpoint_(base.IpEndpoint()),
      request_timeout_ms_(base.RequestTimeoutMs()),
      log_sink_cb_(base.LogSink()),
      logger_(base.logger_set_ ? base.Logger() : nullptr),
      tracer_(base.Tracer()),
      meter_(base.Meter()),
      transport_(base.Transport()) {}

ddnssync::Options::Builder& ddnssync::Options::Builder::UserAgent(
    const std::string& v) {
  if (!v.empty()) user_agent_ = v;
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::IpEndpoint(
    const std::string& v) {
  if (!v.empty()) ip_endpoint_ = v;
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::RequestTimeoutMs(
    int v) {
  request_timeout_ms_ = std::max(1, v);
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::LogSink(
    LogCallback cb) {
  log_sink_cb_ = std::move(cb);
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::Logger(
    std::shared_ptr<ddnsclient::telemetry::Logger> v) {
  logger_ = std::move(v);
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::Tracer(
    std::shared_ptr<ddnsclient::telemetry::Tracer> v) {
  tracer_ = std::move(v);
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::Meter(
    std::shared_ptr<ddnsclient::telemetry::Meter> v) {
  meter_ = std::move(v);
  return *this;
}

ddnssync::Options::Builder& ddnssync::Options::Builder::Transport(
    std::shared_ptr<ddnsclient::HttpTransport> v) {
  transport_ = std::move(v);
  return *this;
}

ddnssync::Options ddnssync::Options::Builder::Build() const {
  const bool logger_set = static_cast<bool>(logger_);
  std::shared_ptr<ddnsclient::telemetry::Logger> logger = logger_;
  if (!logger_set) {
    logger = log_sink_cb_ ? std::make_shared<ContextualLogger>(log_sink_cb_)
                          : ddnsclient::telemetry::NullLogger();
  }
  return ddnssync::Options(
      user_agent_, ip_endpoint_, request_timeout_ms_, log_sink_cb_,
      std::move(logger), logger_set,
      tracer_ ? tracer_ : ddnsclient::telemetry::NullTracer(),
      meter_ ? meter_ : ddnsclient::telemetry::NullMeter(), transport_);
}

// ---------------- Options ----------------
ddnssync::Options::Options() : Options(Builder().Build()) {}

ddnssync::Options::Options(
    std::string user_agent, std::string ip_endpoint, int request_timeout_ms,
    LogCallback log_sink, std::shared_ptr<ddnsclient::telemetry::Logger> logger,
    bool logger_set, std::shared_ptr<ddnsclient::telemetry::Tracer> tracer,
    std::shared_ptr<ddnsclient::telemetry::Meter> meter,
    std::shared_ptr<ddnsclient::HttpTransport> transport)
    : user_agent_(std::move(user_agent)),
      ip_endpoint_(std::move(ip_endpoint)),
      request_timeout_ms_(request_timeout_ms),
      log_sink_cb_(std::move(log_sink)),
      logger_(std::move(logger)),
      logger_set_(logger_set),
      tracer_(std::move(tracer)),
      meter_(std::move(meter)),
      transport_(std::move(transport)) {}

namespace ddnssync {
std::ostream& operator<<(std::ostream& os, const Options& o) {
  os << "user_agent='" << o.UserAgent() << "', ip_endpoint=" << o.IpEndpoint()
     << ", timeout=" << o.RequestTimeoutMs() << "ms"
     << ", transport=" << (o.Transport() ? "injected" : "curl");
  return os;
}
}  // namespace ddnssync
