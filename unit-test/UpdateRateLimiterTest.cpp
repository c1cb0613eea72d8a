#include <gtest/gtest.h>
#include "judge/update_rate_limiter.hpp"

using namespace std;
using namespace nlohmann;
using namespace bridge;

static json case_event(int position) {
    return {{"type", "test-case"}, {"batch", nullptr}, {"cases", json::array({{{"position", position}}})}};
}

static vector<int> positions(const json &event) {
    vector<int> result;
    for (auto &c : event.at("cases")) result.push_back(c.at("position").get<int>());
    return result;
}

TEST(UpdateRateLimiterTest, ForwardsUpToLimit) {
    update_rate_limiter limiter(5, chrono::milliseconds(500));
    auto now = update_rate_limiter::clock::now();

    for (int i = 1; i <= 5; ++i) {
        auto forward = limiter.offer(case_event(i), now);
        ASSERT_EQ(forward.size(), 1u);
        EXPECT_EQ(positions(forward[0]), vector<int>{i});
    }
    EXPECT_EQ(limiter.updates(), 5u);
    EXPECT_FALSE(limiter.flush());
}

TEST(UpdateRateLimiterTest, CoalescesBurst) {
    update_rate_limiter limiter(5, chrono::milliseconds(500));
    auto now = update_rate_limiter::clock::now();

    size_t forwarded = 0;
    for (int i = 1; i <= 12; ++i)
        forwarded += limiter.offer(case_event(i), now).size();
    EXPECT_EQ(forwarded, 5u);

    auto pending = limiter.flush();
    ASSERT_TRUE(pending);
    EXPECT_EQ(positions(*pending), (vector<int>{6, 7, 8, 9, 10, 11, 12}));
    EXPECT_FALSE(limiter.flush());
}

TEST(UpdateRateLimiterTest, PendingGoesFirstInNextWindow) {
    update_rate_limiter limiter(2, chrono::milliseconds(500));
    auto now = update_rate_limiter::clock::now();

    for (int i = 1; i <= 4; ++i) limiter.offer(case_event(i), now);

    auto forward = limiter.offer(case_event(5), now + chrono::milliseconds(600));
    ASSERT_EQ(forward.size(), 2u);
    EXPECT_EQ(positions(forward[0]), (vector<int>{3, 4}));
    EXPECT_EQ(positions(forward[1]), vector<int>{5});
    EXPECT_FALSE(limiter.flush());
}

TEST(UpdateRateLimiterTest, MergedEventKeepsLatestBatch) {
    update_rate_limiter limiter(1, chrono::milliseconds(500));
    auto now = update_rate_limiter::clock::now();

    limiter.offer(case_event(1), now);
    auto second = case_event(2);
    second["batch"] = 1;
    limiter.offer(second, now);
    auto third = case_event(3);
    third["batch"] = 2;
    limiter.offer(third, now);

    auto pending = limiter.flush();
    ASSERT_TRUE(pending);
    EXPECT_EQ(pending->at("batch"), 2);
    EXPECT_EQ(positions(*pending), (vector<int>{2, 3}));
}

TEST(UpdateRateLimiterTest, ResetClearsState) {
    update_rate_limiter limiter(1, chrono::milliseconds(500));
    auto now = update_rate_limiter::clock::now();

    limiter.offer(case_event(1), now);
    limiter.offer(case_event(2), now);
    limiter.reset();

    EXPECT_EQ(limiter.updates(), 0u);
    EXPECT_FALSE(limiter.flush());
    EXPECT_EQ(limiter.offer(case_event(3), now).size(), 1u);
}
