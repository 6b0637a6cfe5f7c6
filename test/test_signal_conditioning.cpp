#include <gtest/gtest.h>

#include "OximeterConfig.h"
#include "SignalConditioning.h"

TEST(ClipTest, ClampsIntoRange) {
    EXPECT_EQ(700, clipSample(0, 700, 14000));
    EXPECT_EQ(14000, clipSample(65535, 700, 14000));
    EXPECT_EQ(5000, clipSample(5000, 700, 14000));
    EXPECT_EQ(700, clipSample(700, 700, 14000));
}

TEST(NormalizeTest, EndpointsMapToZeroAndScale) {
    EXPECT_EQ(0, normalizeSample(700, 700, 14000, 22));
    EXPECT_EQ(22, normalizeSample(14000, 700, 14000, 22));
    EXPECT_EQ(0, normalizeSample(500, 500, 1300, 22));
    EXPECT_EQ(22, normalizeSample(1300, 500, 1300, 22));
    EXPECT_EQ(0, normalizeSample(1300, 500, 1300, 0));
}

TEST(NormalizeTest, TruncatesTowardZero) {
    // 400 / 800 * 22 = 11.0, 499 / 800 * 22 = 13.72
    EXPECT_EQ(11, normalizeSample(900, 500, 1300, 22));
    EXPECT_EQ(13, normalizeSample(999, 500, 1300, 22));
}

TEST(NormalizeTest, EmptyRangeMapsToZero) {
    EXPECT_EQ(0, normalizeSample(900, 900, 900, 22));
    EXPECT_EQ(0, normalizeSample(900, 1300, 500, 22));
}

TEST(WidenTest, FullScaleStaysFullScale) {
    EXPECT_EQ(0, widenReading(0, 12, 16));
    EXPECT_EQ(65535, widenReading(4095, 12, 16));
    EXPECT_EQ(32776, widenReading(2048, 12, 16));
    EXPECT_EQ(16, widenReading(1, 12, 16));
    EXPECT_EQ(1234, widenReading(1234, 16, 16));
}

TEST(ConditionTest, ClipsBeforeNormalizing) {
    ChannelRange red = {RED_MIN_VALUE, RED_MAX_VALUE};
    ChannelRange ir = {IR_MIN_VALUE, IR_MAX_VALUE};
    SamplePair raw = {60000, 100};

    ConditionedSample c = conditionSample(raw, red, ir, GRAPH_HEIGHT);
    EXPECT_EQ(RED_MAX_VALUE, c.redClipped);
    EXPECT_EQ(IR_MIN_VALUE, c.irClipped);
    EXPECT_EQ(GRAPH_HEIGHT, c.redGraph);
    EXPECT_EQ(0, c.irGraph);
}
