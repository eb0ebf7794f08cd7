// Copyright (c) 2025 <Your Name>
#include "ddnsclient/telemetry.hpp"

#include "ddnsclient/context.hpp"

namespace ddnsclient {
namespace telemetry {

namespace {
class NoopSpan : public Span {
 public:
  void SetAttribute(const std::string&, const std::string&) override {}
  void AddEvent(const std::string&) override {}
  void RecordError(const std::string&) override {}
  void End() override {}
  std::string TraceId() const override { return std::string(); }
  std::string SpanId() const override { return std::string(); }
};

class NoopTracer : public Tracer {
 public:
  std::shared_ptr<Span> StartSpan(const Context&,
                                  const std::string&) override {
    return std::make_shared<NoopSpan>();
  }
};

class NoopCounter : public Counter {
 public:
  void Add(const Context&, int64_t) override {}
};

class NoopHistogram : public Histogram {
 public:
  void Record(const Context&, double) override {}
};

class NoopMeter : public Meter {
 public:
  std::shared_ptr<Counter> NewCounter(const std::string&, const std::string&,
                                      const std::string&) override {
    return std::make_shared<NoopCounter>();
  }
  std::shared_ptr<Histogram> NewHistogram(const std::string&,
                                          const std::string&,
                                          const std::string&) override {
    return std::make_shared<NoopHistogram>();
  }
};

class NoopLogger : public Logger {
 public:
  void Info(const Context&, const std::string&, const Fields&) override {}
  void Error(const Context&, const std::string&, const Fields&) override {}
};
}  // namespace

std::shared_ptr<Tracer> NullTracer() { return std::make_shared<NoopTracer>(); }

std::shared_ptr<Meter> NullMeter() { return std::make_shared<NoopMeter>(); }

std::shared_ptr<Logger> NullLogger() { return std::make_shared<NoopLogger>(); }

}  // namespace telemetry
}  // namespace ddnsclient
