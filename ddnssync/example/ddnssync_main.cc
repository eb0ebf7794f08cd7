// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Dynamic DNS sync daemon.
 *
 * Usage:
 *   ddnssync --config /etc/ddnssync.json \
 *     --ip-endpoint http://ifconfig.me/ip --timeout 5000 [--once] [--debug]
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>

#include "ddnssync/config.hpp"
#include "ddnssync/options.hpp"
#include "ddnssync/service.hpp"
#include "ddnssync/telemetry.hpp"

namespace {
/**
 * @brief Thread-safe stderr logger with a local timestamp prefix.
 */
class Logger {
 public:
  void Log(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(stderr, "%s %s\n", Timestamp().c_str(), msg.c_str());
  }

 private:
  static std::string Timestamp() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
  }

  std::mutex mutex_;
};

std::atomic<bool> g_stop{false};

void SignalHandler(int sig) {
  (void)sig;
  g_stop.store(true);
}

void PrintUsage() {
  std::fprintf(stderr,
               "Usage: ddnssync --config PATH [options]\n"
               "Options:\n"
               "  --config PATH        JSON config (required)\n"
               "  --ip-endpoint URL    (default http://ifconfig.me/ip)\n"
               "  --user-agent UA      (default ddnssync/1.0)\n"
               "  --timeout ms         (default 5000)\n"
               "  --once               Run one tick and exit\n"
               "  --debug              Log finished spans\n");
}
}  // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool once = false;
  bool debug = false;

  auto builder = ddnssync::Options::Builder();

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto need = [&](int more) { return i + more < argc; };
    if (a == "--config" && need(1)) {
      config_path = argv[++i];
    } else if (a == "--ip-endpoint" && need(1)) {
      builder.IpEndpoint(argv[++i]);
    } else if (a == "--user-agent" && need(1)) {
      builder.UserAgent(argv[++i]);
    } else if (a == "--timeout" && need(1)) {
      builder.RequestTimeoutMs(std::atoi(argv[++i]));
    } else if (a == "--once") {
      once = true;
    } else if (a == "--debug") {
      debug = true;
    } else if (a == "-h" || a == "--help") {
      PrintUsage();
      return 0;
    } else {
      std::fprintf(stderr, "Unknown or incomplete option: %s\n", a.c_str());
      PrintUsage();
      return 2;
    }
  }
  if (config_path.empty()) {
    std::fprintf(stderr, "--config is required\n");
    PrintUsage();
    return 2;
  }

  ddnssync::Config config;
  ddnssync::Error err;
  if (!ddnssync::LoadConfig(config_path, &config, &err)) {
    std::fprintf(stderr, "Failed to load config: %s\n", err.message.c_str());
    return 1;
  }

  // Create logger
  Logger logger;
  auto log_callback = [&logger](const std::string& msg) { logger.Log(msg); };
  builder.LogSink(log_callback);

  if (debug) {
    builder.Tracer(std::make_shared<ddnssync::BasicTracer>(
        [&logger](const ddnssync::SpanRecord& r) {
          std::ostringstream oss;
          oss << "span " << r;
          logger.Log(oss.str());
        }));
  }
  auto meter = std::make_shared<ddnssync::InMemoryMeter>();
  builder.Meter(meter);

  auto opt = builder.Build();
  auto svc = ddnssync::Service::Create(config, opt, &err);
  if (!svc) {
    std::fprintf(stderr, "Invalid config: %s\n", err.message.c_str());
    return 1;
  }
  {
    std::ostringstream oss;
    oss << "config: " << config << "; options: " << opt;
    logger.Log(oss.str());
  }

  int rc = 0;
  if (once) {
    ddnssync::TickResult r = svc->RunOnce(ddnsclient::Context());
    std::ostringstream oss;
    oss << "tick: " << r;
    logger.Log(oss.str());
    rc = r.error.Failed() ? 1 : 0;
  } else {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    if (!svc->Start()) {
      std::fprintf(stderr, "Failed to start service\n");
      return 1;
    }
    while (!g_stop.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    logger.Log("shutting down");
    svc->Stop();
  }

  std::ostringstream oss;
  oss << "metrics: " << meter->Snapshot();
  logger.Log(oss.str());
  return rc;
}
