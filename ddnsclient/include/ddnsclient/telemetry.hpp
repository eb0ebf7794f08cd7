// Copyright (c) 2025 <Your Name>
/**
 * @file telemetry.hpp
 * @brief Collaborator interfaces for logs, traces and metrics.
 *
 * The core only calls these interfaces. Concrete backends are injected by the
 * owner of the component graph; the Null*() factories return no-op
 * implementations used as defaults.
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ddnsclient {

class Context;

namespace telemetry {

/** Structured key/value attached to a log line or span. */
struct Field {
  std::string key;
  std::string value;
};

using Fields = std::vector<Field>;

/**
 * @brief One unit of traced work.
 *
 * Implementations must tolerate calls from multiple threads. End() is
 * idempotent.
 */
class Span {
 public:
  virtual ~Span() = default;

  virtual void SetAttribute(const std::string& key,
                            const std::string& value) = 0;
  virtual void AddEvent(const std::string& name) = 0;
  virtual void RecordError(const std::string& message) = 0;
  virtual void End() = 0;

  /** Hex trace id; empty for spans that are not recorded. */
  virtual std::string TraceId() const = 0;
  /** Hex span id; empty for spans that are not recorded. */
  virtual std::string SpanId() const = 0;
};

class Tracer {
 public:
  virtual ~Tracer() = default;

  /**
   * @brief Start a span as a child of ctx.CurrentSpan() (if any).
   *
   * The caller attaches the returned span with Context::WithSpan() and ends
   * it with Span::End(). Never returns nullptr.
   */
  virtual std::shared_ptr<Span> StartSpan(const Context& ctx,
                                          const std::string& name) = 0;
};

class Counter {
 public:
  virtual ~Counter() = default;
  virtual void Add(const Context& ctx, int64_t n) = 0;
};

class Histogram {
 public:
  virtual ~Histogram() = default;
  virtual void Record(const Context& ctx, double value) = 0;
};

/** Factory for named instruments. Same name returns the same instrument. */
class Meter {
 public:
  virtual ~Meter() = default;

  virtual std::shared_ptr<Counter> NewCounter(
      const std::string& name, const std::string& description,
      const std::string& unit) = 0;
  virtual std::shared_ptr<Histogram> NewHistogram(
      const std::string& name, const std::string& description,
      const std::string& unit) = 0;
};

class Logger {
 public:
  virtual ~Logger() = default;

  virtual void Info(const Context& ctx, const std::string& msg,
                    const Fields& fields = {}) = 0;
  virtual void Error(const Context& ctx, const std::string& msg,
                     const Fields& fields = {}) = 0;
};

std::shared_ptr<Tracer> NullTracer();
std::shared_ptr<Meter> NullMeter();
std::shared_ptr<Logger> NullLogger();

}  // namespace telemetry
}  // namespace ddnsclient
