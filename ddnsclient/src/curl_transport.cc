// Copyright (c) 2025 <Your Name>
/**
 * @file curl_transport.cc
 * @brief libcurl implementation of HttpTransport.
 */
#include "ddnsclient/curl_transport.hpp"

#include <curl/curl.h>

#include <array>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ddnsclient {

namespace {
// Provider and echo bodies are a few bytes; anything larger is not ours.
constexpr size_t kMaxBodyBytes = 64 * 1024;
// Upper bound of idle handles kept for reuse.
constexpr size_t kMaxIdleHandles = 32;

std::once_flag g_curl_init_once;

struct EasyDeleter {
  void operator()(CURL* h) const {
    if (h) curl_easy_cleanup(h);
  }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

struct TransferState {
  const Context* ctx = nullptr;
  std::string body;
  bool overflow = false;
};

size_t WriteBody(char* data, size_t size, size_t nmemb, void* userp) {
  auto* st = static_cast<TransferState*>(userp);
  const size_t n = size * nmemb;
  if (st->body.size() + n > kMaxBodyBytes) {
    st->overflow = true;
    return 0;  // aborts the transfer with CURLE_WRITE_ERROR
  }
  st->body.append(data, n);
  return n;
}

int OnProgress(void* userp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* st = static_cast<TransferState*>(userp);
  return (st->ctx && st->ctx->IsCancelled()) ? 1 : 0;
}

std::string Escape(CURL* h, const std::string& s) {
  char* out = curl_easy_escape(h, s.c_str(), static_cast<int>(s.size()));
  if (!out) return std::string();
  std::string r(out);
  curl_free(out);
  return r;
}

std::string BuildUrl(CURL* h, const HttpRequest& req) {
  std::string url = req.url;
  if (req.query.empty()) return url;
  url.push_back(url.find('?') == std::string::npos ? '?' : '&');
  bool first = true;
  for (const auto& kv : req.query) {
    if (!first) url.push_back('&');
    first = false;
    url += Escape(h, kv.first);
    url.push_back('=');
    url += Escape(h, kv.second);
  }
  return url;
}
}  // namespace

class CurlTransport::Impl {
 public:
  Impl() {
    std::call_once(g_curl_init_once,
                   []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    share_ = curl_share_init();
    if (share_) {
      curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &Impl::Lock);
      curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &Impl::Unlock);
      curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
      curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    }
  }

  ~Impl() {
    // Easy handles reference the share handle; release them first.
    {
      std::lock_guard<std::mutex> lk(pool_mtx_);
      idle_.clear();
    }
    if (share_) curl_share_cleanup(share_);
  }

  bool Get(const Context& ctx, const HttpRequest& req, HttpResponse* resp,
           std::string* err) {
    if (ctx.IsCancelled()) {
      if (err) *err = "context canceled";
      return false;
    }
    EasyHandle h = Acquire();
    if (!h) {
      if (err) *err = "failed to create HTTP handle";
      return false;
    }

    TransferState st;
    st.ctx = &ctx;
    std::array<char, CURL_ERROR_SIZE> errbuf{};
    const std::string url = BuildUrl(h.get(), req);
    const std::string agent = req.user_agent.empty()
                                  ? std::string(kDefaultUserAgent)
                                  : req.user_agent;

    CURL* c = h.get();
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(c, CURLOPT_USERAGENT, agent.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout_ms));
    curl_easy_setopt(c, CURLOPT_ERRORBUFFER, errbuf.data());
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, &WriteBody);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, &OnProgress);
    curl_easy_setopt(c, CURLOPT_XFERINFODATA, &st);
    if (share_) curl_easy_setopt(c, CURLOPT_SHARE, share_);
    if (!req.username.empty()) {
      curl_easy_setopt(c, CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
      curl_easy_setopt(c, CURLOPT_USERNAME, req.username.c_str());
      curl_easy_setopt(c, CURLOPT_PASSWORD, req.password.c_str());
    }

    const CURLcode rc = curl_easy_perform(c);
    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);

    // Drop per-request pointers before the handle goes back to the pool.
    curl_easy_reset(c);
    Release(std::move(h));

    if (rc != CURLE_OK) {
      if (err) {
        if (rc == CURLE_ABORTED_BY_CALLBACK) {
          *err = "context canceled";
        } else if (st.overflow) {
          *err = "response body too large";
        } else if (errbuf[0] != '\0') {
          *err = errbuf.data();
        } else {
          *err = curl_easy_strerror(rc);
        }
      }
      return false;
    }

    resp->status = static_cast<int>(status);
    resp->body = std::move(st.body);
    return true;
  }

  size_t IdleHandles() const {
    std::lock_guard<std::mutex> lk(pool_mtx_);
    return idle_.size();
  }

 private:
  EasyHandle Acquire() {
    {
      std::lock_guard<std::mutex> lk(pool_mtx_);
      if (!idle_.empty()) {
        EasyHandle h = std::move(idle_.back());
        idle_.pop_back();
        return h;
      }
    }
    return EasyHandle(curl_easy_init());
  }

  void Release(EasyHandle h) {
    std::lock_guard<std::mutex> lk(pool_mtx_);
    if (idle_.size() < kMaxIdleHandles) idle_.push_back(std::move(h));
  }

  static void Lock(CURL*, curl_lock_data data, curl_lock_access, void* userp) {
    auto* self = static_cast<Impl*>(userp);
    self->share_locks_[static_cast<size_t>(data) % kLockSlots].lock();
  }

  static void Unlock(CURL*, curl_lock_data data, void* userp) {
    auto* self = static_cast<Impl*>(userp);
    self->share_locks_[static_cast<size_t>(data) % kLockSlots].unlock();
  }

  static constexpr size_t kLockSlots = CURL_LOCK_DATA_LAST;

  CURLSH* share_ = nullptr;
  std::array<std::mutex, kLockSlots> share_locks_;

  mutable std::mutex pool_mtx_;
  std::vector<EasyHandle> idle_;
};

CurlTransport::CurlTransport() : impl_(std::make_unique<Impl>()) {}

CurlTransport::~CurlTransport() = default;

bool CurlTransport::Get(const Context& ctx, const HttpRequest& req,
                        HttpResponse* resp, std::string* err) {
  return impl_->Get(ctx, req, resp, err);
}

size_t CurlTransport::IdleHandles() const { return impl_->IdleHandles(); }

}  // namespace ddnsclient
