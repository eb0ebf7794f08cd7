// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief In-process telemetry implementations.
 */
#include "ddnssync/telemetry.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>
#include <utility>

#include "ddnsclient/context.hpp"

using ddnsclient::Context;
using ddnsclient::telemetry::Field;
using ddnsclient::telemetry::Fields;

namespace ddnssync {

namespace {
bool NeedsQuoting(const std::string& v) {
  if (v.empty()) return true;
  return std::any_of(v.begin(), v.end(), [](char c) {
    return c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t';
  });
}

std::string Quote(const std::string& v) {
  std::string out;
  out.reserve(v.size() + 2);
  out.push_back('"');
  for (char c : v) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out.push_back(c);
        break;
    }
  }
  out.push_back('"');
  return out;
}
}  // namespace

// ---------------- ContextualLogger ----------------
std::string FormatLogLine(const char* level, const std::string& msg,
                          const Fields& fields) {
  std::ostringstream oss;
  oss << "level=" << level << " msg=" << Quote(msg);
  for (const auto& f : fields) {
    oss << ' ' << f.key << '='
        << (NeedsQuoting(f.value) ? Quote(f.value) : f.value);
  }
  return oss.str();
}

ContextualLogger::ContextualLogger(LogCallback sink) : sink_(std::move(sink)) {}

void ContextualLogger::Info(const Context& ctx, const std::string& msg,
                            const Fields& fields) {
  Write("info", ctx, msg, fields);
}

void ContextualLogger::Error(const Context& ctx, const std::string& msg,
                             const Fields& fields) {
  Write("error", ctx, msg, fields);
}

void ContextualLogger::Write(const char* level, const Context& ctx,
                             const std::string& msg, const Fields& fields) {
  Fields all = fields;
  if (auto* span = ctx.CurrentSpan()) {
    span->AddEvent(msg);
    for (const auto& f : fields) {
      if (f.key == "error") {
        span->RecordError(f.value);
      } else {
        span->SetAttribute(f.key, f.value);
      }
    }
    const std::string trace_id = span->TraceId();
    if (!trace_id.empty()) {
      all.push_back(Field{"traceID", trace_id});
      all.push_back(Field{"spanID", span->SpanId()});
    }
  }
  if (sink_) sink_(FormatLogLine(level, msg, all));
}

// ---------------- BasicTracer ----------------
std::ostream& operator<<(std::ostream& os, const SpanRecord& r) {
  os << "span=" << r.name << " trace=" << r.trace_id << " id=" << r.span_id;
  if (!r.parent_span_id.empty()) os << " parent=" << r.parent_span_id;
  os << " dur_ms=" << r.duration_ms;
  for (const auto& a : r.attributes) os << ' ' << a.key << '=' << a.value;
  if (!r.error.empty()) os << " error=" << Quote(r.error);
  return os;
}

namespace {
class RecordingSpan : public ddnsclient::telemetry::Span {
 public:
  RecordingSpan(SpanRecord rec, BasicTracer::SpanCallback on_end)
      : rec_(std::move(rec)),
        on_end_(std::move(on_end)),
        start_(std::chrono::steady_clock::now()) {}

  ~RecordingSpan() override { End(); }

  void SetAttribute(const std::string& key,
                    const std::string& value) override {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto& a : rec_.attributes) {
      if (a.key == key) {
        a.value = value;
        return;
      }
    }
    rec_.attributes.push_back(Field{key, value});
  }

  void AddEvent(const std::string& name) override {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.events.push_back(name);
  }

  void RecordError(const std::string& message) override {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.error = message;
  }

  void End() override {
    if (ended_.exchange(true)) return;
    SpanRecord done;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      rec_.duration_ms = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - start_)
                             .count();
      done = rec_;
    }
    if (on_end_) on_end_(done);
  }

  std::string TraceId() const override { return rec_.trace_id; }
  std::string SpanId() const override { return rec_.span_id; }

 private:
  mutable std::mutex mtx_;
  SpanRecord rec_;
  BasicTracer::SpanCallback on_end_;
  std::chrono::steady_clock::time_point start_;
  std::atomic<bool> ended_{false};
};
}  // namespace

BasicTracer::BasicTracer(SpanCallback on_end)
    : on_end_(std::move(on_end)), rng_(std::random_device{}()) {}

std::string BasicTracer::RandomHex(int bytes) {
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<size_t>(bytes) * 2);
  std::lock_guard<std::mutex> lk(rng_mtx_);
  uint64_t v = 0;
  for (int i = 0; i < bytes; ++i) {
    if (i % 8 == 0) v = rng_();
    const unsigned b = static_cast<unsigned>(v & 0xFF);
    v >>= 8;
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0xF]);
  }
  return out;
}

std::shared_ptr<ddnsclient::telemetry::Span> BasicTracer::StartSpan(
    const Context& ctx, const std::string& name) {
  SpanRecord rec;
  rec.name = name;
  rec.span_id = RandomHex(8);
  auto* parent = ctx.CurrentSpan();
  const std::string parent_trace = parent ? parent->TraceId() : std::string();
  if (!parent_trace.empty()) {
    rec.trace_id = parent_trace;
    rec.parent_span_id = parent->SpanId();
  } else {
    rec.trace_id = RandomHex(16);
  }
  return std::make_shared<RecordingSpan>(std::move(rec), on_end_);
}

// ---------------- InMemoryMeter ----------------
namespace {
class AtomicCounter : public ddnsclient::telemetry::Counter {
 public:
  void Add(const Context&, int64_t n) override {
    value_.fetch_add(n, std::memory_order_relaxed);
  }
  int64_t Value() const { return value_.load(std::memory_order_relaxed); }

 private:
  std::atomic<int64_t> value_{0};
};

class BucketHistogram : public ddnsclient::telemetry::Histogram {
 public:
  explicit BucketHistogram(std::vector<double> bounds) {
    snap_.bounds = std::move(bounds);
    snap_.buckets.assign(snap_.bounds.size() + 1, 0);
  }

  void Record(const Context&, double value) override {
    std::lock_guard<std::mutex> lk(mtx_);
    if (snap_.count == 0) {
      snap_.min = value;
      snap_.max = value;
    } else {
      snap_.min = std::min(snap_.min, value);
      snap_.max = std::max(snap_.max, value);
    }
    ++snap_.count;
    snap_.sum += value;
    auto it =
        std::lower_bound(snap_.bounds.begin(), snap_.bounds.end(), value);
    ++snap_.buckets[static_cast<size_t>(it - snap_.bounds.begin())];
  }

  HistogramSnapshot Snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return snap_;
  }

 private:
  mutable std::mutex mtx_;
  HistogramSnapshot snap_;
};
}  // namespace

struct InMemoryMeter::Impl {
  mutable std::mutex mtx;
  std::map<std::string, std::shared_ptr<AtomicCounter>> counters;
  std::map<std::string, std::shared_ptr<BucketHistogram>> histograms;
};

InMemoryMeter::InMemoryMeter() : p_(new Impl()) {}
InMemoryMeter::~InMemoryMeter() = default;

const std::vector<double>& InMemoryMeter::DefaultBounds() {
  static const std::vector<double> kBounds = {
      1, 2, 5, 10, 25, 50, 100, 250, 500, 1000, 2500, 5000, 10000};
  return kBounds;
}

std::shared_ptr<ddnsclient::telemetry::Counter> InMemoryMeter::NewCounter(
    const std::string& name, const std::string& /*description*/,
    const std::string& /*unit*/) {
  std::lock_guard<std::mutex> lk(p_->mtx);
  auto& slot = p_->counters[name];
  if (!slot) slot = std::make_shared<AtomicCounter>();
  return slot;
}

std::shared_ptr<ddnsclient::telemetry::Histogram> InMemoryMeter::NewHistogram(
    const std::string& name, const std::string& /*description*/,
    const std::string& /*unit*/) {
  std::lock_guard<std::mutex> lk(p_->mtx);
  auto& slot = p_->histograms[name];
  if (!slot) slot = std::make_shared<BucketHistogram>(DefaultBounds());
  return slot;
}

MetricsSnapshot InMemoryMeter::Snapshot() const {
  MetricsSnapshot out;
  std::lock_guard<std::mutex> lk(p_->mtx);
  for (const auto& kv : p_->counters) {
    out.counters[kv.first] = kv.second->Value();
  }
  for (const auto& kv : p_->histograms) {
    out.histograms[kv.first] = kv.second->Snapshot();
  }
  return out;
}

std::ostream& operator<<(std::ostream& os, const MetricsSnapshot& m) {
  bool first = true;
  for (const auto& kv : m.counters) {
    if (!first) os << ", ";
    first = false;
    os << kv.first << "=" << kv.second;
  }
  for (const auto& kv : m.histograms) {
    if (!first) os << ", ";
    first = false;
    const auto& h = kv.second;
    os << kv.first << "{count=" << h.count;
    if (h.count > 0) {
      os << " avg=" << (h.sum / static_cast<double>(h.count))
         << " min=" << h.min << " max=" << h.max;
    }
    os << "}";
  }
  return os;
}

}  // namespace ddnssync
