#include "termbar/bar/state.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace termbar::bar;
using namespace std::chrono_literals;

TEST(State, FirstIncrementStartsClock) {
    State s;
    s.total = 100;
    auto t0 = Clock::now();
    
    s.applyIncrement(10, t0);
    EXPECT_EQ(s.current, 10);
    EXPECT_EQ(s.start_time, t0);
    EXPECT_EQ(s.block_start_time, t0);
    EXPECT_EQ(s.time_elapsed.count(), 0);
    EXPECT_EQ(s.time_per_item.count(), 0);
}

TEST(State, TimePerItemIsExponentiallySmoothed) {
    State s;
    s.total = 100;
    auto t0 = Clock::now();
    
    s.applyIncrement(10, t0);
    s.applyIncrement(10, t0 + 40ms);
    // 0.25 * (40ms / 10)
    EXPECT_EQ(s.time_per_item, std::chrono::nanoseconds(1ms));
    EXPECT_EQ(s.time_elapsed, std::chrono::nanoseconds(40ms));
    
    s.applyIncrement(20, t0 + 120ms);
    // 0.25 * (80ms / 20) + 0.75 * 1ms
    EXPECT_EQ(s.time_per_item, std::chrono::nanoseconds(1750us));
    EXPECT_EQ(s.current, 40);
    
    auto stats = s.statistics();
    EXPECT_EQ(stats.eta(), 60 * std::chrono::nanoseconds(1750us));
}

TEST(State, CustomAlpha) {
    State s;
    s.total = 10;
    s.eta_alpha = 1.0;
    auto t0 = Clock::now();
    
    s.applyIncrement(1, t0);
    s.applyIncrement(2, t0 + 10ms);
    EXPECT_EQ(s.time_per_item, std::chrono::nanoseconds(5ms));
}

TEST(State, UnknownTotalNeverCompletes) {
    State s;
    s.total = 0;
    auto t0 = Clock::now();
    s.applyIncrement(1000, t0);
    EXPECT_EQ(s.current, 1000);
    EXPECT_FALSE(s.completed);
}

TEST(State, UnknownTotalSaturatesInsteadOfOverflowing) {
    constexpr int64_t max = std::numeric_limits<int64_t>::max();
    State s;
    s.total = 0;
    auto t0 = Clock::now();
    
    s.applyIncrement(max - 10, t0);
    s.applyIncrement(max, t0 + 1ms);
    EXPECT_EQ(s.current, max);
    s.applyIncrement(1, t0 + 2ms);
    EXPECT_EQ(s.current, max);
    EXPECT_FALSE(s.completed);
    EXPECT_EQ(s.statistics().eta().count(), 0);
}

TEST(State, CompletedStateIgnoresIncrements) {
    State s;
    s.total = 5;
    auto t0 = Clock::now();
    s.applyIncrement(5, t0);
    ASSERT_TRUE(s.completed);
    auto elapsed = s.time_elapsed;
    
    s.applyIncrement(3, t0 + 1s);
    EXPECT_EQ(s.current, 5);
    EXPECT_EQ(s.time_elapsed, elapsed);
}

TEST(Statistics, SerializesToJson) {
    Statistics stats;
    stats.id = 3;
    stats.total = 10;
    stats.current = 4;
    stats.time_per_item = 2ms;
    
    auto json = toJson(stats);
    EXPECT_EQ(json["id"], 3);
    EXPECT_EQ(json["current"], 4);
    EXPECT_EQ(json["eta_ms"], 12);
    EXPECT_EQ(json["completed"], false);
}
