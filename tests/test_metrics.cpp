#include <gtest/gtest.h>
#include "utils/metrics.hpp"

using namespace wheel;

class MetricsTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset_all();
    }
};

// ============================================================================
// Histogram
// ============================================================================

TEST_F(MetricsTest, Histogram_Percentiles) {
    LatencyHistogram hist("test", 100);
    for (int i = 1; i <= 100; ++i) hist.record(std::chrono::milliseconds(i));

    EXPECT_EQ(hist.count(), 100);
    EXPECT_EQ(hist.max(), std::chrono::milliseconds(100));
    EXPECT_EQ(hist.p50(), std::chrono::milliseconds(50));
    EXPECT_EQ(hist.percentile(0.0), std::chrono::milliseconds(1));
}

TEST_F(MetricsTest, Histogram_RingKeepsRecentSamples) {
    LatencyHistogram hist("test", 4);
    for (int i = 1; i <= 8; ++i) hist.record(std::chrono::milliseconds(i));

    EXPECT_EQ(hist.count(), 8);
    EXPECT_EQ(hist.percentile(0.0), std::chrono::milliseconds(5));
    EXPECT_EQ(hist.max(), std::chrono::milliseconds(8));

    hist.reset();
    EXPECT_EQ(hist.count(), 0);
    EXPECT_EQ(hist.p99(), Duration::zero());
}

// ============================================================================
// Registry
// ============================================================================

TEST_F(MetricsTest, Registry_SummaryAndReset) {
    WHEEL_COUNTER("test_orders").increment(3);
    WHEEL_COUNTER("test_cycles").increment();
    WHEEL_GAUGE("test_cash").set(1250.5);

    EXPECT_EQ(&WHEEL_COUNTER("test_orders"), &MetricsRegistry::instance().counter("test_orders"));

    std::string summary = MetricsRegistry::instance().summary();
    EXPECT_NE(summary.find("test_orders=3"), std::string::npos);
    EXPECT_NE(summary.find("test_cycles=1"), std::string::npos);

    auto j = MetricsRegistry::instance().to_json();
    EXPECT_DOUBLE_EQ(j["gauges"]["test_cash"].get<double>(), 1250.5);

    MetricsRegistry::instance().reset_all();
    EXPECT_EQ(WHEEL_COUNTER("test_orders").value(), 0);
    EXPECT_DOUBLE_EQ(WHEEL_GAUGE("test_cash").value(), 0.0);
}

TEST_F(MetricsTest, ScopedLatency_RecordsOnExit) {
    {
        ScopedLatency timer(WHEEL_HISTOGRAM("test_scope"));
    }
    EXPECT_EQ(WHEEL_HISTOGRAM("test_scope").count(), 1);
}
