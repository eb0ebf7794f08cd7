// Copyright (c) 2025 <Your Name>
/**
 * @file
 * @brief In-process telemetry: contextual logger, tracer and metrics.
 *
 * These implement the ddnsclient::telemetry interfaces without any external
 * backend. Log lines go to a LogCallback, finished spans to a SpanCallback,
 * and metrics are aggregated in memory and read through Snapshot().
 */
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <random>
#include <string>
#include <vector>

#include "ddnsclient/telemetry.hpp"

namespace ddnssync {

using LogCallback = std::function<void(const std::string&)>;

/**
 * @brief Logger that formats key=value lines and annotates the current span.
 *
 * Line format: `level=<info|error> msg="<msg>" key=value ...`. When the
 * context carries a recorded span, `traceID` and `spanID` are appended, the
 * message is added as a span event, fields become span attributes, and an
 * `error` field is recorded as the span's error.
 */
class ContextualLogger : public ddnsclient::telemetry::Logger {
 public:
  explicit ContextualLogger(LogCallback sink);

  void Info(const ddnsclient::Context& ctx, const std::string& msg,
            const ddnsclient::telemetry::Fields& fields = {}) override;
  void Error(const ddnsclient::Context& ctx, const std::string& msg,
             const ddnsclient::telemetry::Fields& fields = {}) override;

 private:
  void Write(const char* level, const ddnsclient::Context& ctx,
             const std::string& msg,
             const ddnsclient::telemetry::Fields& fields);

  LogCallback sink_;
};

/** Format one log line (exposed for tests). */
std::string FormatLogLine(const char* level, const std::string& msg,
                          const ddnsclient::telemetry::Fields& fields);

/** Finished span as delivered to BasicTracer's callback. */
struct SpanRecord {
  std::string name;
  std::string trace_id;
  std::string span_id;
  std::string parent_span_id;  ///< Empty for root spans
  double duration_ms = 0.0;
  ddnsclient::telemetry::Fields attributes;
  std::vector<std::string> events;
  std::string error;

  friend std::ostream& operator<<(std::ostream& os, const SpanRecord& r);
};

/**
 * @brief Tracer with random ids and a completion callback.
 *
 * Children started from a context that carries a span inherit its trace id.
 */
class BasicTracer : public ddnsclient::telemetry::Tracer {
 public:
  using SpanCallback = std::function<void(const SpanRecord&)>;

  explicit BasicTracer(SpanCallback on_end = SpanCallback());

  std::shared_ptr<ddnsclient::telemetry::Span> StartSpan(
      const ddnsclient::Context& ctx, const std::string& name) override;

 private:
  std::string RandomHex(int bytes);

  SpanCallback on_end_;
  std::mutex rng_mtx_;
  std::mt19937_64 rng_;
};

struct HistogramSnapshot {
  uint64_t count = 0;
  double sum = 0.0;
  double min = 0.0;
  double max = 0.0;
  std::vector<double> bounds;     ///< Upper bucket bounds (inclusive)
  std::vector<uint64_t> buckets;  ///< bounds.size() + 1 entries (overflow)
};

struct MetricsSnapshot {
  std::map<std::string, int64_t> counters;
  std::map<std::string, HistogramSnapshot> histograms;

  friend std::ostream& operator<<(std::ostream& os, const MetricsSnapshot& m);
};

/**
 * @brief Thread-safe in-memory Meter.
 *
 * Histograms use fixed latency-style bucket bounds (milliseconds).
 */
class InMemoryMeter : public ddnsclient::telemetry::Meter {
 public:
  InMemoryMeter();
  ~InMemoryMeter() override;

  std::shared_ptr<ddnsclient::telemetry::Counter> NewCounter(
      const std::string& name, const std::string& description,
      const std::string& unit) override;
  std::shared_ptr<ddnsclient::telemetry::Histogram> NewHistogram(
      const std::string& name, const std::string& description,
      const std::string& unit) override;

  MetricsSnapshot Snapshot() const;

  static const std::vector<double>& DefaultBounds();

 private:
  struct Impl;
  std::unique_ptr<Impl> p_;
};

}  // namespace ddnssync
