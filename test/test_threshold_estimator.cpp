#include <gtest/gtest.h>

#include "ThresholdEstimator.h"

namespace {

RawBuffer filledWith(uint16_t low, uint16_t high) {
    RawBuffer buf;
    for (size_t i = 0; i < buf.size(); i++) {
        buf.push(i % 2 ? high : low);
    }
    return buf;
}

}  // namespace

TEST(ThresholdTest, MidpointUsesIntegerDivision) {
    EXPECT_EQ(5000, midpointThreshold(filledWith(4000, 6000)));
    EXPECT_EQ(5000, midpointThreshold(filledWith(4000, 6001)));
}

TEST(ThresholdTest, StartsAtZero) {
    ThresholdEstimator est;
    EXPECT_EQ(0, est.threshold());
    EXPECT_EQ(0, est.counter());
}

TEST(ThresholdTest, RecomputesOnEveryFiftyFirstCycle) {
    ThresholdEstimator est(50);
    RawBuffer buf = filledWith(4000, 6000);

    for (int cycle = 1; cycle <= 50; cycle++) {
        EXPECT_FALSE(est.update(buf)) << "cycle " << cycle;
        EXPECT_EQ(0, est.threshold());
    }
    EXPECT_TRUE(est.update(buf));
    EXPECT_EQ(5000, est.threshold());
    EXPECT_EQ(0, est.counter());

    // the pattern repeats after the reset
    int refreshes = 0;
    for (int cycle = 1; cycle <= 51 * 3; cycle++) {
        if (est.update(buf)) {
            refreshes++;
            EXPECT_EQ(0, cycle % 51);
        }
    }
    EXPECT_EQ(3, refreshes);
}

TEST(ThresholdTest, HeldBetweenRefreshes) {
    ThresholdEstimator est(2);
    est.update(filledWith(0, 100));
    est.update(filledWith(0, 100));
    EXPECT_TRUE(est.update(filledWith(0, 100)));
    EXPECT_EQ(50, est.threshold());

    // new data does not move it until the next refresh
    EXPECT_FALSE(est.update(filledWith(1000, 3000)));
    EXPECT_EQ(50, est.threshold());
    EXPECT_FALSE(est.update(filledWith(1000, 3000)));
    EXPECT_TRUE(est.update(filledWith(1000, 3000)));
    EXPECT_EQ(2000, est.threshold());
}
