// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @test OptionsTest.BuilderAndStream
 * @brief Verify Options builder defaults, clamping and stream operator.
 *
 * @steps
 * 1. Build Options via Builder with custom values.
 * 2. Stream to ostringstream.
 *
 * @expected Stream contains key fields like "timeout=".
 */
#include "ddnssync/service.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "ddnsclient/ip_resolver.hpp"
#include "ddnssync/telemetry.hpp"
#include "fake_http_transport.hpp"

using ddnsclient::CancelSource;
using ddnsclient::Context;
using ddnsclient::ErrorCode;
using ddnsclient::Host;
using ddnsclient::UpdateClient;
using ddnsclient::test::FakeHttpTransport;
using ddnssync::Config;
using ddnssync::Error;
using ddnssync::Options;
using ddnssync::Service;
using ddnssync::TickResult;
using std::chrono::milliseconds;

TEST(OptionsTest, BuilderAndStream) {
  auto defaults = Options();
  EXPECT_EQ(defaults.UserAgent(), ddnsclient::kDefaultUserAgent);
  EXPECT_EQ(defaults.IpEndpoint(), ddnsclient::IpResolver::kDefaultEndpoint);
  EXPECT_EQ(defaults.RequestTimeoutMs(), 5000);
  EXPECT_NE(defaults.Logger(), nullptr);
  EXPECT_NE(defaults.Tracer(), nullptr);
  EXPECT_NE(defaults.Meter(), nullptr);
  EXPECT_EQ(defaults.Transport(), nullptr);

  auto opts = Options::Builder()
                  .UserAgent("")  // keeps default
                  .IpEndpoint("http://ip.test/")
                  .RequestTimeoutMs(0)
                  .Build();
  EXPECT_EQ(opts.UserAgent(), ddnsclient::kDefaultUserAgent);
  EXPECT_EQ(opts.IpEndpoint(), "http://ip.test/");
  EXPECT_EQ(opts.RequestTimeoutMs(), 1);

  auto copy = Options::Builder(opts).UserAgent("x/2").Build();
  EXPECT_EQ(copy.UserAgent(), "x/2");
  EXPECT_EQ(copy.IpEndpoint(), "http://ip.test/");

  std::ostringstream oss;
  oss << opts;
  EXPECT_NE(oss.str().find("timeout="), std::string::npos);
}

/**
 * @test OptionsTest.DerivedBuilderReplacesLogSink
 * @brief A new LogSink on a builder derived from Options takes effect, while
 *        an explicitly set Logger is carried over.
 */
TEST(OptionsTest, DerivedBuilderReplacesLogSink) {
  std::vector<std::string> old_lines;
  std::vector<std::string> new_lines;
  auto base =
      Options::Builder()
          .LogSink([&](const std::string& l) { old_lines.push_back(l); })
          .Build();

  auto derived =
      Options::Builder(base)
          .LogSink([&](const std::string& l) { new_lines.push_back(l); })
          .Build();
  derived.Logger()->Info(Context(), "hello from derived");
  EXPECT_TRUE(old_lines.empty());
  ASSERT_EQ(new_lines.size(), 1u);
  EXPECT_NE(new_lines[0].find("hello from derived"), std::string::npos);

  // Keeping the sink keeps logging to it.
  auto same = Options::Builder(base).UserAgent("x/3").Build();
  same.Logger()->Info(Context(), "still old");
  ASSERT_EQ(old_lines.size(), 1u);

  // An explicit logger survives a sink change on a derived builder.
  std::vector<std::string> explicit_lines;
  auto explicit_logger = std::make_shared<ddnssync::ContextualLogger>(
      [&](const std::string& l) { explicit_lines.push_back(l); });
  auto with_logger = Options::Builder().Logger(explicit_logger).Build();
  auto rederived =
      Options::Builder(with_logger)
          .LogSink([&](const std::string& l) { new_lines.push_back(l); })
          .Build();
  EXPECT_EQ(rederived.Logger(), explicit_logger);
  rederived.Logger()->Info(Context(), "explicit");
  EXPECT_EQ(explicit_lines.size(), 1u);
  EXPECT_EQ(new_lines.size(), 1u);
}

namespace {
const char* kIpUrl = "http://ip.test/";

Config MakeConfig(std::vector<Host> hosts, milliseconds interval) {
  Config cfg;
  cfg.interval = interval;
  cfg.hosts = std::move(hosts);
  return cfg;
}

std::shared_ptr<FakeHttpTransport> GoodTransport() {
  auto http = std::make_shared<FakeHttpTransport>();
  http->RouteStatic(kIpUrl, FakeHttpTransport::Reply::Ok(200, "1.2.3.4"));
  http->RouteStatic(UpdateClient::kUpdateEndpoint,
                    FakeHttpTransport::Reply::Ok(200, "good 1.2.3.4"));
  return http;
}
}  // namespace

/**
 * @test ServiceTest.HostsRoundTrip
 * @brief Reading back the host list yields the configured ordered sequence.
 */
TEST(ServiceTest, HostsRoundTrip) {
  const std::vector<Host> hosts = {{"b.example", "u1", "p1"},
                                   {"a.example", "u2", "p2"},
                                   {"b.example", "u3", "p3"}};
  Error err;
  auto svc = Service::Create(MakeConfig(hosts, milliseconds(1000)),
                             Options::Builder().Transport(GoodTransport())
                                 .Build(),
                             &err);
  ASSERT_NE(svc, nullptr) << err;
  EXPECT_EQ(svc->Hosts(), hosts);
  EXPECT_EQ(svc->GetConfig().interval, milliseconds(1000));
}

/**
 * @test ServiceTest.CreateRejectsInvalidConfig
 * @brief Missing credentials or a bad interval are fatal ConfigErrors.
 */
TEST(ServiceTest, CreateRejectsInvalidConfig) {
  Error err;
  EXPECT_EQ(Service::Create(MakeConfig({{"h", "u", "p"}}, milliseconds(0)),
                            Options(), &err),
            nullptr);
  EXPECT_EQ(err.code, ErrorCode::Config);

  err = Error();
  EXPECT_EQ(Service::Create(MakeConfig({{"h", "", "p"}}, milliseconds(10)),
                            Options(), &err),
            nullptr);
  EXPECT_EQ(err.code, ErrorCode::Config);

  err = Error();
  EXPECT_EQ(Service::Create(MakeConfig({}, milliseconds(10)), Options(),
                            &err),
            nullptr);
  EXPECT_EQ(err.code, ErrorCode::Config);
}

/**
 * @test ServiceTest.RunOnceRecordsLastTick
 * @brief A single tick updates every host and is kept as the last tick.
 */
TEST(ServiceTest, RunOnceRecordsLastTick) {
  auto http = GoodTransport();
  auto meter = std::make_shared<ddnssync::InMemoryMeter>();
  Error err;
  auto svc = Service::Create(
      MakeConfig({{"a", "u", "p"}, {"b", "u", "p"}}, milliseconds(1000)),
      Options::Builder()
          .Transport(http)
          .IpEndpoint(kIpUrl)
          .UserAgent("svc-test/1")
          .Meter(meter)
          .Build(),
      &err);
  ASSERT_NE(svc, nullptr) << err;

  TickResult last;
  EXPECT_FALSE(svc->GetLastTick(&last));

  TickResult r = svc->RunOnce(Context());
  EXPECT_FALSE(r.error.Failed()) << r;
  EXPECT_EQ(r.ip, "1.2.3.4");
  EXPECT_EQ(http->Calls(UpdateClient::kUpdateEndpoint), 2);
  for (const auto& req : http->Requests()) {
    EXPECT_EQ(req.user_agent, "svc-test/1");
  }

  ASSERT_TRUE(svc->GetLastTick(&last));
  EXPECT_EQ(last.hosts.size(), 2u);
  EXPECT_EQ(meter->Snapshot().counters["operation_count"], 1);
}

/**
 * @test ServiceTest.StartStop
 * @brief Background loop ticks immediately and stops on Stop().
 *
 * @steps
 * 1. Start with a long interval.
 * 2. Wait for the first tick, then Stop().
 *
 * @expected One tick; Stop returns promptly; a second Start works.
 */
TEST(ServiceTest, StartStop) {
  auto http = GoodTransport();
  Error err;
  auto svc = Service::Create(
      MakeConfig({{"a", "u", "p"}}, milliseconds(60000)),
      Options::Builder().Transport(http).IpEndpoint(kIpUrl).Build(), &err);
  ASSERT_NE(svc, nullptr) << err;

  ASSERT_TRUE(svc->Start());
  EXPECT_TRUE(svc->IsRunning());
  EXPECT_FALSE(svc->Start());

  TickResult last;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (!svc->GetLastTick(&last) &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(5));
  }
  ASSERT_TRUE(svc->GetLastTick(&last));
  EXPECT_EQ(last.ip, "1.2.3.4");

  const auto stop_at = std::chrono::steady_clock::now();
  svc->Stop();
  EXPECT_LT(std::chrono::steady_clock::now() - stop_at, milliseconds(2000));
  EXPECT_FALSE(svc->IsRunning());
  EXPECT_EQ(http->Calls(kIpUrl), 1);

  ASSERT_TRUE(svc->Start());
  svc->Stop();
}

TEST(ServiceTest, RunReturnsCancelled) {
  Error err;
  auto svc = Service::Create(
      MakeConfig({{"a", "u", "p"}}, milliseconds(10)),
      Options::Builder().Transport(GoodTransport()).IpEndpoint(kIpUrl).Build(),
      &err);
  ASSERT_NE(svc, nullptr) << err;
  CancelSource src;
  std::thread t([&src]() {
    std::this_thread::sleep_for(milliseconds(50));
    src.Cancel();
  });
  Error run_err = svc->Run(src.GetContext());
  t.join();
  EXPECT_EQ(run_err.code, ErrorCode::Cancelled);
}
