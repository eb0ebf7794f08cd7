// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Service assembly and background loop control.
 */
#include "ddnssync/service.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "ddnsclient/curl_transport.hpp"
#include "ddnsclient/ip_resolver.hpp"
#include "internal/reconcile_engine.hpp"
#include "internal/scheduler.hpp"

using ddnsclient::CancelSource;
using ddnsclient::Context;

struct ddnssync::Service::Impl : public internal::Reconciler {
  Config config;
  Options opt;

  // Collaborators; the transport outlives resolver and client.
  std::shared_ptr<ddnsclient::HttpTransport> transport;
  std::unique_ptr<ddnsclient::IpResolver> resolver;
  std::unique_ptr<ddnsclient::UpdateClient> client;
  std::unique_ptr<internal::ReconcileEngine> engine;

  // Serializes ticks between RunOnce and the scheduler loop
  std::mutex exec_mtx;

  mutable std::mutex tick_mtx;
  bool has_tick = false;
  TickResult last_tick;

  // Background loop
  std::atomic<bool> running{false};
  std::unique_ptr<CancelSource> cancel;
  std::thread thread;

  TickResult Execute(const Context& ctx) override {
    TickResult r;
    {
      std::lock_guard<std::mutex> lk(exec_mtx);
      r = engine->Execute(ctx);
    }
    std::lock_guard<std::mutex> lk(tick_mtx);
    last_tick = r;
    has_tick = true;
    return r;
  }

  ddnsclient::Error Loop(const Context& ctx) {
    opt.Logger()->Info(
        ctx, "Starting Dynamic DNS service",
        {{"interval", std::to_string(config.interval.count()) + "ms"},
         {"hosts", std::to_string(config.hosts.size())}});
    internal::Scheduler scheduler(config.interval, this, opt.Logger());
    return scheduler.Run(ctx);
  }
};

ddnssync::Service::Service() : p_(new Impl) {}

ddnssync::Service::~Service() { Stop(); }

std::unique_ptr<ddnssync::Service> ddnssync::Service::Create(
    const Config& config, const Options& opt, Error* err) {
  if (!ValidateConfig(config, err)) return nullptr;

  std::unique_ptr<Service> svc(new Service());
  Impl* p = svc->p_.get();
  p->config = config;
  p->opt = opt;
  p->transport = opt.Transport();
  if (!p->transport) {
    p->transport = std::make_shared<ddnsclient::CurlTransport>();
  }

  p->resolver.reset(new ddnsclient::IpResolver(
      p->transport.get(), opt.IpEndpoint(), opt.UserAgent(),
      opt.RequestTimeoutMs()));
  p->client.reset(new ddnsclient::UpdateClient(
      p->transport.get(), opt.UserAgent(), opt.RequestTimeoutMs()));
  p->engine.reset(new internal::ReconcileEngine(
      p->resolver.get(), p->client.get(), config.hosts, opt));
  return svc;
}

const std::vector<ddnsclient::Host>& ddnssync::Service::Hosts() const {
  return p_->engine->Hosts();
}

const ddnssync::Config& ddnssync::Service::GetConfig() const {
  return p_->config;
}

ddnssync::Options ddnssync::Service::GetOptions() const { return p_->opt; }

ddnssync::TickResult ddnssync::Service::RunOnce(const Context& ctx) {
  return p_->Execute(ctx);
}

ddnssync::Error ddnssync::Service::Run(const Context& ctx) {
  return p_->Loop(ctx);
}

bool ddnssync::Service::Start() {
  if (p_->running.exchange(true)) return false;
  p_->cancel.reset(new CancelSource());
  const Context ctx = p_->cancel->GetContext();
  p_->thread = std::thread([this, ctx]() {
    ddnsclient::Error e = p_->Loop(ctx);
    if (e.code != ErrorCode::Cancelled) {
      p_->opt.Logger()->Error(ctx, "Service stopped unexpectedly",
                              {{"error", e.message}});
    }
  });
  return true;
}

void ddnssync::Service::Stop() {
  if (!p_->running.exchange(false)) return;
  p_->cancel->Cancel();
  if (p_->thread.joinable()) p_->thread.join();
}

bool ddnssync::Service::IsRunning() const {
  return p_->running.load(std::memory_order_acquire);
}

bool ddnssync::Service::GetLastTick(TickResult* out) const {
  std::lock_guard<std::mutex> lk(p_->tick_mtx);
  if (!p_->has_tick) return false;
  if (out) *out = p_->last_tick;
  return true;
}
