// Copyright (c) 2025 <Your Name>
#include "ddnsclient/update_client.hpp"

#include <string>
#include <utility>

namespace ddnsclient {

UpdateClient::UpdateClient(HttpTransport* transport, std::string user_agent,
                           int timeout_ms)
    : transport_(transport),
      user_agent_(std::move(user_agent)),
      timeout_ms_(timeout_ms) {
  if (user_agent_.empty()) user_agent_ = kDefaultUserAgent;
}

HttpRequest UpdateClient::BuildRequest(const Host& host,
                                       const std::string& ip) const {
  HttpRequest req;
  req.url = kUpdateEndpoint;
  req.query.emplace_back("hostname", host.hostname);
  req.query.emplace_back("myip", ip);
  req.user_agent = user_agent_;
  req.username = host.user;
  req.password = host.password;
  req.timeout_ms = timeout_ms_;
  return req;
}

bool UpdateClient::Update(const Context& ctx, const Host& host,
                          const std::string& ip, HttpResponse* resp,
                          Error* err) const {
  std::string cause;
  if (!transport_->Get(ctx, BuildRequest(host, ip), resp, &cause)) {
    if (err) {
      *err = Wrap(ErrorCode::HostUpdate,
                  "failed to make request to Dynamic DNS Service", cause);
    }
    return false;
  }
  return true;
}

}  // namespace ddnsclient
