// Copyright (c) 2025 <Your Name>
#include "ddnsclient/ip_resolver.hpp"

#include <arpa/inet.h>
#include <json/json.h>

#include <cctype>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

namespace ddnsclient {

namespace {
std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

bool ParseJsonIp(const std::string& text, std::string* ip, std::string* err) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value root;
  std::string perr;
  if (!reader->parse(text.data(), text.data() + text.size(), &root, &perr)) {
    if (err) *err = "invalid JSON response: " + perr;
    return false;
  }
  if (!root.isObject() || !root.isMember("ip") || !root["ip"].isString()) {
    if (err) *err = "JSON response has no \"ip\" string";
    return false;
  }
  *ip = Trim(root["ip"].asString());
  return true;
}
}  // namespace

bool IsIpLiteral(const std::string& s) {
  if (s.empty()) return false;
  unsigned char buf[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, s.c_str(), buf) == 1 ||
         inet_pton(AF_INET6, s.c_str(), buf) == 1;
}

bool ParseIpResponse(const std::string& body, std::string* ip,
                     std::string* err) {
  const std::string text = Trim(body);
  std::string candidate;
  if (!text.empty() && text.front() == '{') {
    if (!ParseJsonIp(text, &candidate, err)) return false;
  } else {
    candidate = text;
  }
  if (!IsIpLiteral(candidate)) {
    if (err) {
      // Cap echoed garbage (HTML error pages) in the message.
      std::string shown = candidate.substr(0, 64);
      *err = "response is not an IP address: '" + shown + "'";
    }
    return false;
  }
  *ip = std::move(candidate);
  return true;
}

IpResolver::IpResolver(HttpTransport* transport, std::string endpoint,
                       std::string user_agent, int timeout_ms)
    : transport_(transport),
      endpoint_(std::move(endpoint)),
      user_agent_(std::move(user_agent)),
      timeout_ms_(timeout_ms) {
  if (user_agent_.empty()) user_agent_ = kDefaultUserAgent;
}

bool IpResolver::Resolve(const Context& ctx, std::string* ip,
                         Error* err) const {
  HttpRequest req;
  req.url = endpoint_;
  req.user_agent = user_agent_;
  req.timeout_ms = timeout_ms_;

  HttpResponse resp;
  std::string cause;
  if (!transport_->Get(ctx, req, &resp, &cause)) {
    if (err) {
      *err = Wrap(ErrorCode::IpResolution, "failed to execute HTTP request",
                  cause);
    }
    return false;
  }

  if (resp.status < 200 || resp.status >= 300) {
    if (err) {
      std::ostringstream oss;
      oss << "failed to make IP lookup, failed with status code '"
          << resp.status << "'";
      *err = Error(ErrorCode::IpResolution, oss.str());
    }
    return false;
  }

  std::string parse_err;
  if (!ParseIpResponse(resp.body, ip, &parse_err)) {
    if (err) {
      *err = Wrap(ErrorCode::IpResolution, "failed to read body", parse_err);
    }
    return false;
  }
  return true;
}

}  // namespace ddnsclient
