#include "utils/metrics.hpp"
#include <algorithm>
#include <fmt/format.h>

namespace wheel {

LatencyHistogram::LatencyHistogram(const std::string& name, size_t capacity)
    : name_(name)
    , capacity_(std::max<size_t>(capacity, 1))
{
    ring_ns_.reserve(capacity_);
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ring_ns_.size() < capacity_) {
        ring_ns_.push_back(d.count());
    } else {
        ring_ns_[next_] = d.count();
    }
    next_ = (next_ + 1) % capacity_;
    count_++;
}

Duration LatencyHistogram::percentile(double p) const {
    std::vector<int64_t> samples;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        samples = ring_ns_;
    }
    if (samples.empty()) return Duration::zero();

    p = std::clamp(p, 0.0, 100.0);
    size_t idx = static_cast<size_t>((p / 100.0) * (samples.size() - 1));
    std::nth_element(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(idx), samples.end());
    return Duration(samples[idx]);
}

Duration LatencyHistogram::max() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.empty()) return Duration::zero();
    return Duration(*std::max_element(ring_ns_.begin(), ring_ns_.end()));
}

void LatencyHistogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_ns_.clear();
    next_ = 0;
    count_ = 0;
}

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) slot = std::make_unique<Counter>();
    return *slot;
}

Gauge& MetricsRegistry::gauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) slot = std::make_unique<Gauge>();
    return *slot;
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) slot = std::make_unique<LatencyHistogram>(name);
    return *slot;
}

nlohmann::json MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json j;
    j["counters"] = nlohmann::json::object();
    for (const auto& [name, counter] : counters_) {
        j["counters"][name] = counter->value();
    }
    j["gauges"] = nlohmann::json::object();
    for (const auto& [name, gauge] : gauges_) {
        j["gauges"][name] = gauge->value();
    }
    j["histograms"] = nlohmann::json::object();
    for (const auto& [name, hist] : histograms_) {
        j["histograms"][name] = {
            {"count", hist->count()},
            {"p50_ms", std::chrono::duration<double, std::milli>(hist->p50()).count()},
            {"p99_ms", std::chrono::duration<double, std::milli>(hist->p99()).count()},
            {"max_ms", std::chrono::duration<double, std::milli>(hist->max()).count()}
        };
    }
    return j;
}

std::string MetricsRegistry::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string s;
    for (const auto& [name, counter] : counters_) {
        if (!s.empty()) s += ' ';
        s += fmt::format("{}={}", name, counter->value());
    }
    return s;
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) counter->reset();
    for (auto& [name, gauge] : gauges_) gauge->set(0.0);
    for (auto& [name, hist] : histograms_) hist->reset();
}

ScopedLatency::ScopedLatency(LatencyHistogram& histogram)
    : histogram_(histogram)
    , start_(now())
{
}

ScopedLatency::~ScopedLatency() {
    histogram_.record(now() - start_);
}

} // namespace wheel
