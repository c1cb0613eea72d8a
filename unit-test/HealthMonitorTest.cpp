#include <gtest/gtest.h>
#include <atomic>
#include <limits>
#include <stdexcept>
#include "config.hpp"
#include "judge/health_monitor.hpp"
#include "test/mocks.hpp"

using namespace std;
using namespace bridge;

TEST(HealthMonitorTest, NoSamplesYet) {
    health_monitor health(6);
    EXPECT_FALSE(health.latency());
    EXPECT_FALSE(health.time_delta());
    EXPECT_EQ(health.samples(), 0u);
    EXPECT_GT(health.load(), 1e50);
}

TEST(HealthMonitorTest, AveragesLatencyAndClockSkew) {
    health_monitor health(6);
    health.ping_sent(100.0);
    health.ping_sent(110.0);
    ASSERT_TRUE(health.record(100.0, 100.2, 90.1, 0.5));
    ASSERT_TRUE(health.record(110.0, 110.4, 100.2, 1.5));

    ASSERT_TRUE(health.latency());
    EXPECT_NEAR(*health.latency(), 0.3, 1e-9);
    ASSERT_TRUE(health.time_delta());
    EXPECT_NEAR(*health.time_delta(), 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(health.load(), 1.5);
    EXPECT_EQ(health.samples(), 2u);
}

TEST(HealthMonitorTest, WindowEvictsOldestSample) {
    health_monitor health(6);
    health.ping_sent(0.0);
    ASSERT_TRUE(health.record(0.0, 7.0, 3.5, 0));
    for (int i = 0; i < 6; ++i) {
        health.ping_sent(10.0);
        ASSERT_TRUE(health.record(10.0, 11.0, 10.5, 0));
    }

    EXPECT_EQ(health.samples(), 6u);
    EXPECT_NEAR(*health.latency(), 1.0, 1e-9);
    EXPECT_NEAR(*health.time_delta(), 0.0, 1e-9);
}

TEST(HealthMonitorTest, InvalidSamplesAreRejected) {
    health_monitor health(6);
    for (int i = 0; i < 4; ++i) health.ping_sent(10.0);
    EXPECT_FALSE(health.record(10.0, 9.0, 9.5, 0));
    EXPECT_FALSE(health.record(10.0, numeric_limits<double>::infinity(), 9.5, 0));
    EXPECT_FALSE(health.record(10.0, 11.0, numeric_limits<double>::quiet_NaN(), 0));
    EXPECT_FALSE(health.record(10.0, 11.0, 10.5, numeric_limits<double>::infinity()));
    EXPECT_EQ(health.samples(), 0u);
    EXPECT_FALSE(health.latency());
}

TEST(HealthMonitorTest, OnlySentPingsCanBeAnswered) {
    health_monitor health(2);
    EXPECT_FALSE(health.record(10.0, 11.0, 10.5, 0));

    health.ping_sent(10.0);
    EXPECT_FALSE(health.record(10.25, 11.0, 10.5, 0));
    EXPECT_TRUE(health.record(10.0, 11.0, 10.5, 0));
    // 同一个心跳包不能回复两次
    EXPECT_FALSE(health.record(10.0, 11.0, 10.5, 0));

    // 超出窗口的旧心跳包被遗忘
    health.ping_sent(20.0);
    health.ping_sent(30.0);
    health.ping_sent(40.0);
    EXPECT_FALSE(health.record(20.0, 21.0, 20.5, 0));
    EXPECT_TRUE(health.record(40.0, 41.0, 40.5, 0));
    EXPECT_TRUE(health.record(30.0, 31.0, 30.5, 0));
    EXPECT_EQ(health.samples(), 2u);
}

TEST(HealthMonitorTest, PingsPeriodically) {
    auto old_interval = PING_INTERVAL;
    PING_INTERVAL = chrono::milliseconds(20);

    atomic<int> pings{0};
    {
        health_monitor health(6);
        atomic<double> last{0};
        health.start([&](double when) {
            last = when;
            ++pings;
        }, [] { FAIL() << "ping failed"; });
        EXPECT_TRUE(test::eventually([&] { return pings >= 3; }));
        EXPECT_TRUE(health.record(last, last + 0.1, last, 0));
        health.stop();
    }
    int stopped = pings;
    this_thread::sleep_for(chrono::milliseconds(60));
    EXPECT_EQ(pings, stopped);

    PING_INTERVAL = old_interval;
}

TEST(HealthMonitorTest, SendFailureIsFatal) {
    atomic<bool> fatal{false};
    health_monitor health(6);
    health.start([](double) { throw runtime_error("broken pipe"); }, [&] { fatal = true; });
    EXPECT_TRUE(test::eventually([&] { return fatal.load(); }));
}
