#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace wheel {

/**
 * Bounded latency sample window. Keeps the most recent `capacity` samples
 * in a ring and answers percentiles over them.
 */
class LatencyHistogram {
public:
    explicit LatencyHistogram(const std::string& name, size_t capacity = 4096);

    void record(Duration d);

    Duration percentile(double p) const;
    Duration p50() const { return percentile(50.0); }
    Duration p99() const { return percentile(99.0); }
    Duration max() const;

    int64_t count() const { return count_.load(); }
    void reset();

private:
    std::string name_;
    size_t capacity_;
    std::atomic<int64_t> count_{0};

    mutable std::mutex mutex_;
    std::vector<int64_t> ring_ns_;
    size_t next_{0};
};

class Counter {
public:
    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void reset() { value_ = 0; }

private:
    std::atomic<int64_t> value_{0};
};

// Last written value
class Gauge {
public:
    void set(double value) { value_ = value; }
    double value() const { return value_.load(); }

private:
    std::atomic<double> value_{0.0};
};

/**
 * Process-wide metrics registry: cycles run, decisions by action, reports by
 * condition, order outcomes, portfolio gauges and cycle latency.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    Counter& counter(const std::string& name);
    Gauge& gauge(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);

    nlohmann::json to_json() const;

    // One log-friendly line with every counter
    std::string summary() const;

    void reset_all();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
};

#define WHEEL_COUNTER(name) ::wheel::MetricsRegistry::instance().counter(name)
#define WHEEL_GAUGE(name) ::wheel::MetricsRegistry::instance().gauge(name)
#define WHEEL_HISTOGRAM(name) ::wheel::MetricsRegistry::instance().histogram(name)

/**
 * Records the scope's duration into a histogram on destruction.
 */
class ScopedLatency {
public:
    explicit ScopedLatency(LatencyHistogram& histogram);
    ~ScopedLatency();

    ScopedLatency(const ScopedLatency&) = delete;
    ScopedLatency& operator=(const ScopedLatency&) = delete;

private:
    LatencyHistogram& histogram_;
    Timestamp start_;
};

} // namespace wheel
