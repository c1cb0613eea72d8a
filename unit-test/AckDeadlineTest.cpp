#include <gtest/gtest.h>
#include <atomic>
#include "judge/ack_deadline.hpp"
#include "test/mocks.hpp"

using namespace std;
using namespace bridge;

TEST(AckDeadlineTest, FiresWhenNotDisarmed) {
    atomic<int> fired{0};
    ack_deadline ack;
    ack.arm(chrono::milliseconds(20), [&] { ++fired; });
    EXPECT_TRUE(ack.armed());
    EXPECT_TRUE(test::eventually([&] { return fired == 1; }));
    EXPECT_FALSE(ack.armed());
    EXPECT_FALSE(ack.disarm());
}

TEST(AckDeadlineTest, DisarmCancels) {
    atomic<int> fired{0};
    ack_deadline ack;
    ack.arm(chrono::milliseconds(100), [&] { ++fired; });
    EXPECT_TRUE(ack.disarm());
    EXPECT_FALSE(ack.disarm());
    this_thread::sleep_for(chrono::milliseconds(200));
    EXPECT_EQ(fired, 0);
}

TEST(AckDeadlineTest, RearmReplacesPreviousDeadline) {
    atomic<int> first{0}, second{0};
    ack_deadline ack;
    ack.arm(chrono::milliseconds(50), [&] { ++first; });
    ack.arm(chrono::milliseconds(20), [&] { ++second; });
    EXPECT_TRUE(test::eventually([&] { return second == 1; }));
    this_thread::sleep_for(chrono::milliseconds(100));
    EXPECT_EQ(first, 0);
}

TEST(AckDeadlineTest, StopWithoutArm) {
    ack_deadline ack;
    EXPECT_FALSE(ack.armed());
    ack.stop();
    EXPECT_FALSE(ack.disarm());
}
