// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Implementation of the reconcile pass.
 *
 * The IP is resolved once, then every host is updated from its own thread.
 * Host threads share nothing but the (thread-safe) transport behind the
 * UpdateClient and write only to their own HostResult slot.
 */
#include "internal/reconcile_engine.hpp"

#include <chrono>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>

#include "ddnsclient/result_classifier.hpp"

using ddnsclient::Context;
using ddnsclient::Error;
using ddnsclient::ErrorCode;
using ddnsclient::Outcome;

namespace ddnssync {
namespace internal {

namespace {
double SinceInMilliseconds(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}
}  // namespace

ReconcileEngine::ReconcileEngine(const ddnsclient::IpResolver* resolver,
                                 const ddnsclient::UpdateClient* client,
                                 std::vector<ddnsclient::Host> hosts,
                                 const Options& opt)
    : resolver_(resolver),
      client_(client),
      hosts_(std::move(hosts)),
      log_(opt.Logger()),
      tracer_(opt.Tracer()) {
  auto meter = opt.Meter();
  count_ = meter->NewCounter("operation_count",
                             "Number of times the service is ran", "1");
  errors_ = meter->NewCounter(
      "operation_errors", "Number of times the service encounters an error",
      "1");
  latency_ = meter->NewHistogram("operation_latency",
                                 "Latency when the service is ran", "ms");
  host_count_ = meter->NewCounter("host_update_count",
                                  "Number of host update requests", "1");
  host_errors_ = meter->NewCounter("host_update_errors",
                                   "Number of failed host updates", "1");
}

TickResult ReconcileEngine::Execute(const Context& parent) {
  auto span = tracer_->StartSpan(parent, "execution");
  const Context ctx = parent.WithSpan(span);
  count_->Add(ctx, 1);
  const auto start = std::chrono::steady_clock::now();

  TickResult result;

  // 1. Resolve the public IP once; abort the pass on failure.
  std::string ip;
  Error err;
  if (!resolver_->Resolve(ctx, &ip, &err)) {
    result.error = ddnsclient::Wrap(ErrorCode::IpResolution,
                                    "failed to get local IP address",
                                    err.message);
    log_->Error(ctx, "Failed to resolve external IP address",
                {{"error", result.error.message}});
  } else {
    result.ip = ip;
    span->SetAttribute("ip", ip);
    log_->Info(ctx, "Resolved external IP address", {{"ip", ip}});

    // 2. Fan out one update per host. No cap; every host is launched.
    result.hosts.resize(hosts_.size());
    std::vector<std::thread> workers;
    workers.reserve(hosts_.size());
    for (size_t i = 0; i < hosts_.size(); ++i) {
      HostResult* slot = &result.hosts[i];
      slot->host = hosts_[i];
      try {
        workers.emplace_back(
            [this, &ctx, &ip, slot]() { UpdateHost(ctx, ip, slot); });
      } catch (const std::system_error& e) {
        slot->outcome = Outcome::MakeFailed(e.what());
        slot->error = ddnsclient::Wrap(ErrorCode::HostUpdate,
                                       "failed to launch update", e.what());
        host_errors_->Add(ctx, 1);
        log_->Error(ctx, "Failed to update DNS record",
                    {{"hostname", slot->host.hostname},
                     {"error", slot->error.message}});
      }
    }

    // 3. Wait for every launched update.
    for (auto& t : workers) t.join();

    // 4. Aggregate; identities stay in the per-host results and reports.
    const int failed = result.FailureCount();
    if (failed > 0) {
      std::ostringstream oss;
      oss << failed << " of " << hosts_.size() << " host updates failed";
      result.error = Error(ErrorCode::HostUpdate, oss.str());
    }
  }

  span->End();
  latency_->Record(ctx, SinceInMilliseconds(start));
  if (result.error.Failed()) errors_->Add(ctx, 1);
  return result;
}

void ReconcileEngine::UpdateHost(const Context& parent, const std::string& ip,
                                 HostResult* out) {
  auto span = tracer_->StartSpan(parent, "update");
  const Context ctx = parent.WithSpan(span);
  span->SetAttribute("hostname", out->host.hostname);
  host_count_->Add(ctx, 1);

  ddnsclient::HttpResponse resp;
  Error err;
  if (!client_->Update(ctx, out->host, ip, &resp, &err)) {
    out->outcome = Outcome::MakeFailed(err.message);
    out->error = err;
  } else {
    span->SetAttribute("statusCode", std::to_string(resp.status));
    out->outcome = ddnsclient::Classify(resp.status, resp.body);
    if (out->outcome.IsFailed()) {
      if (resp.status >= 300) {
        std::ostringstream oss;
        oss << "failed to query Dynamic DNS Service, received '"
            << resp.status << "'";
        out->error = Error(ErrorCode::HostUpdate, oss.str());
      } else {
        out->error = Error(
            ErrorCode::ProtocolResponse,
            "received error code from Dynamic DNS service: " + resp.body);
      }
    }
  }

  switch (out->outcome.kind) {
    case Outcome::Kind::Updated:
      span->SetAttribute("change", "good");
      log_->Info(ctx, "Updated DNS record",
                 {{"hostname", out->host.hostname}, {"ip", ip}});
      break;
    case Outcome::Kind::Unchanged:
      span->SetAttribute("change", "nochange");
      log_->Info(ctx, "DNS record unchanged",
                 {{"hostname", out->host.hostname}, {"ip", ip}});
      break;
    case Outcome::Kind::Failed:
      host_errors_->Add(ctx, 1);
      log_->Error(ctx, "Failed to update DNS record",
                  {{"hostname", out->host.hostname},
                   {"error", out->error.message}});
      break;
  }
  span->End();
}

}  // namespace internal
}  // namespace ddnssync
