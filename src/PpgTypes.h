#pragma once

#include <stdint.h>

enum Channel {
    CHANNEL_RED,
    CHANNEL_IR
};

// Raw photodetector readings taken in one cycle, one per emitter
struct SamplePair {
    uint16_t red;
    uint16_t ir;
};

// Physical range a channel is clipped into
struct ChannelRange {
    uint16_t minValue;
    uint16_t maxValue;

    bool isValid() const { return minValue < maxValue; }
};

// One cycle after clipping and display normalization
struct ConditionedSample {
    uint16_t redClipped;
    uint16_t irClipped;
    uint8_t redGraph;
    uint8_t irGraph;
};
