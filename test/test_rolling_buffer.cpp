#include <gtest/gtest.h>

#include "RollingBuffer.h"
#include "SignalBuffer.h"

TEST(RollingBufferTest, StartsFullOfZeros) {
    RollingBuffer<uint16_t, 5> buf;
    EXPECT_EQ(5u, buf.size());
    for (size_t i = 0; i < buf.size(); i++) {
        EXPECT_EQ(0, buf.at(i));
    }
    EXPECT_EQ(0, buf.maxValue());
    EXPECT_EQ(0, buf.minValue());
}

TEST(RollingBufferTest, PushEvictsOldestAndKeepsOrder) {
    RollingBuffer<int, 4> buf;
    for (int v = 1; v <= 6; v++) {
        buf.push(v);
        EXPECT_EQ(4u, buf.size());
        EXPECT_EQ(v, buf.last());
    }
    // holds 3, 4, 5, 6 oldest to newest
    EXPECT_EQ(3, buf.at(0));
    EXPECT_EQ(4, buf.at(1));
    EXPECT_EQ(5, buf.at(2));
    EXPECT_EQ(6, buf.at(3));
}

TEST(RollingBufferTest, MaxAndMinTrackWindow) {
    RollingBuffer<int, 3> buf;
    buf.push(9);
    buf.push(2);
    buf.push(5);
    EXPECT_EQ(9, buf.maxValue());
    EXPECT_EQ(2, buf.minValue());

    buf.push(4);   // evicts 9
    EXPECT_EQ(5, buf.maxValue());
    buf.push(7);   // evicts 2
    EXPECT_EQ(4, buf.minValue());
}

TEST(SignalBufferTest, OnePushPerBufferPerCycle) {
    SignalBuffer buffers;
    SamplePair raw = {15000, 200};
    ConditionedSample cond = {14000, 500, 22, 0};
    buffers.push(raw, cond);

    EXPECT_EQ(15000, buffers.rawRed().last());
    EXPECT_EQ(200, buffers.rawIr().last());
    EXPECT_EQ(22, buffers.graphRed().last());
    EXPECT_EQ(0, buffers.graphIr().last());

    EXPECT_EQ((size_t)RAW_BUFFER_SIZE, buffers.rawRed().size());
    EXPECT_EQ((size_t)GRAPH_WIDTH, buffers.graphIr().size());
    // the previous newest is now second to last
    EXPECT_EQ(0, buffers.rawRed().at(RAW_BUFFER_SIZE - 2));
}
