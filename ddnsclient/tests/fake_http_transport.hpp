// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief Scriptable in-process HttpTransport for tests.
 *
 * Requests are routed by exact URL (query excluded) to a handler. Every call
 * is recorded so tests can assert on request shape and call counts.
 */
#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ddnsclient/http_transport.hpp"

namespace ddnsclient {
namespace test {

class FakeHttpTransport : public HttpTransport {
 public:
  /** Scripted answer: transport failure when `ok` is false. */
  struct Reply {
    bool ok = true;
    int status = 200;
    std::string body;
    std::string err;

    static Reply Ok(int status, std::string body) {
      Reply r;
      r.status = status;
      r.body = std::move(body);
      return r;
    }
    static Reply Fail(std::string err) {
      Reply r;
      r.ok = false;
      r.err = std::move(err);
      return r;
    }
  };

  using Handler = std::function<Reply(const Context&, const HttpRequest&)>;

  void Route(const std::string& url, Handler h) {
    std::lock_guard<std::mutex> lk(mtx_);
    routes_[url] = std::move(h);
  }

  void RouteStatic(const std::string& url, Reply reply) {
    Route(url, [reply](const Context&, const HttpRequest&) { return reply; });
  }

  bool Get(const Context& ctx, const HttpRequest& req, HttpResponse* resp,
           std::string* err) override {
    Handler h;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      requests_.push_back(req);
      auto it = routes_.find(req.url);
      if (it != routes_.end()) h = it->second;
    }
    if (!h) {
      if (err) *err = "no route for " + req.url;
      return false;
    }
    // Handlers may block; never hold the lock here.
    Reply r = h(ctx, req);
    if (!r.ok) {
      if (err) *err = r.err;
      return false;
    }
    resp->status = r.status;
    resp->body = r.body;
    return true;
  }

  std::vector<HttpRequest> Requests() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return requests_;
  }

  int Calls(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto& r : requests_) {
      if (r.url == url) ++n;
    }
    return n;
  }

  /** Requests to `url` whose query has `key` == `value`. */
  int CallsWith(const std::string& url, const std::string& key,
                const std::string& value) const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto& r : requests_) {
      if (r.url != url) continue;
      for (const auto& q : r.query) {
        if (q.first == key && q.second == value) {
          ++n;
          break;
        }
      }
    }
    return n;
  }

 private:
  mutable std::mutex mtx_;
  std::map<std::string, Handler> routes_;
  std::vector<HttpRequest> requests_;
};

/** Query value for `key`, or empty. */
inline std::string QueryValue(const HttpRequest& req, const std::string& key) {
  for (const auto& q : req.query) {
    if (q.first == key) return q.second;
  }
  return std::string();
}

}  // namespace test
}  // namespace ddnsclient
