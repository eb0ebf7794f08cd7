// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Tests for IpResolver and the IP-echo body parser.
 */
#include "ddnsclient/ip_resolver.hpp"

#include <gtest/gtest.h>

#include <string>

#include "fake_http_transport.hpp"

using ddnsclient::Context;
using ddnsclient::Error;
using ddnsclient::ErrorCode;
using ddnsclient::IpResolver;
using ddnsclient::test::FakeHttpTransport;

namespace {
const char* kEndpoint = "http://ip.test/";
}  // namespace

/**
 * @test ParseIpResponseTest.PlainAndJson
 * @brief Plain text is trimmed; a JSON object's "ip" field is accepted.
 */
TEST(ParseIpResponseTest, PlainAndJson) {
  std::string ip;
  std::string err;
  ASSERT_TRUE(ddnsclient::ParseIpResponse("  203.0.113.7\n", &ip, &err));
  EXPECT_EQ(ip, "203.0.113.7");
  ASSERT_TRUE(ddnsclient::ParseIpResponse("{\"ip\": \"2001:db8::1\"}\n", &ip,
                                          &err));
  EXPECT_EQ(ip, "2001:db8::1");
}

TEST(ParseIpResponseTest, RejectsGarbage) {
  std::string ip = "unchanged";
  std::string err;
  EXPECT_FALSE(ddnsclient::ParseIpResponse("<html>oops</html>", &ip, &err));
  EXPECT_NE(err.find("not an IP address"), std::string::npos);
  EXPECT_EQ(ip, "unchanged");
  EXPECT_FALSE(ddnsclient::ParseIpResponse("   ", &ip, &err));
  EXPECT_FALSE(ddnsclient::ParseIpResponse("{\"addr\": \"1.2.3.4\"}", &ip,
                                           &err));
  EXPECT_NE(err.find("\"ip\""), std::string::npos);
  EXPECT_FALSE(ddnsclient::ParseIpResponse("{not json", &ip, &err));
}

TEST(IsIpLiteralTest, V4AndV6) {
  EXPECT_TRUE(ddnsclient::IsIpLiteral("1.2.3.4"));
  EXPECT_TRUE(ddnsclient::IsIpLiteral("::1"));
  EXPECT_FALSE(ddnsclient::IsIpLiteral("1.2.3"));
  EXPECT_FALSE(ddnsclient::IsIpLiteral("example.com"));
  EXPECT_FALSE(ddnsclient::IsIpLiteral(""));
}

/**
 * @test IpResolverTest.ResolveSendsOneRequest
 * @brief Resolve() issues exactly one GET with the configured agent.
 *
 * @expected IP is returned trimmed; one call; agent and timeout propagated.
 */
TEST(IpResolverTest, ResolveSendsOneRequest) {
  FakeHttpTransport http;
  http.RouteStatic(kEndpoint, FakeHttpTransport::Reply::Ok(200, "1.2.3.4\n"));
  IpResolver resolver(&http, kEndpoint, "agent/2", 1234);

  std::string ip;
  Error err;
  ASSERT_TRUE(resolver.Resolve(Context(), &ip, &err)) << err;
  EXPECT_EQ(ip, "1.2.3.4");
  EXPECT_FALSE(err.Failed());
  ASSERT_EQ(http.Calls(kEndpoint), 1);
  const auto req = http.Requests().front();
  EXPECT_EQ(req.user_agent, "agent/2");
  EXPECT_EQ(req.timeout_ms, 1234);
  EXPECT_TRUE(req.query.empty());
  EXPECT_TRUE(req.username.empty());
}

TEST(IpResolverTest, EmptyAgentFallsBackToDefault) {
  FakeHttpTransport http;
  http.RouteStatic(kEndpoint, FakeHttpTransport::Reply::Ok(200, "1.2.3.4"));
  IpResolver resolver(&http, kEndpoint, "");
  std::string ip;
  Error err;
  ASSERT_TRUE(resolver.Resolve(Context(), &ip, &err));
  EXPECT_EQ(http.Requests().front().user_agent, ddnsclient::kDefaultUserAgent);
}

/**
 * @test IpResolverTest.FailuresAreIpResolutionErrors
 * @brief Transport failure, non-2xx and bad bodies all map to IpResolution.
 */
TEST(IpResolverTest, FailuresAreIpResolutionErrors) {
  FakeHttpTransport http;
  IpResolver resolver(&http, kEndpoint);
  std::string ip;
  Error err;

  http.RouteStatic(kEndpoint, FakeHttpTransport::Reply::Fail("timeout"));
  EXPECT_FALSE(resolver.Resolve(Context(), &ip, &err));
  EXPECT_EQ(err.code, ErrorCode::IpResolution);
  EXPECT_EQ(err.message, "failed to execute HTTP request: timeout");

  http.RouteStatic(kEndpoint, FakeHttpTransport::Reply::Ok(503, "busy"));
  EXPECT_FALSE(resolver.Resolve(Context(), &ip, &err));
  EXPECT_EQ(err.code, ErrorCode::IpResolution);
  EXPECT_EQ(err.message,
            "failed to make IP lookup, failed with status code '503'");

  http.RouteStatic(kEndpoint, FakeHttpTransport::Reply::Ok(200, "nope"));
  EXPECT_FALSE(resolver.Resolve(Context(), &ip, &err));
  EXPECT_EQ(err.code, ErrorCode::IpResolution);
  EXPECT_EQ(err.message.rfind("failed to read body: ", 0), 0u);

  EXPECT_EQ(http.Calls(kEndpoint), 3);
}
