#include "ThresholdEstimator.h"

int32_t midpointThreshold(const RawBuffer& buffer) {
    return ((int32_t)buffer.maxValue() + (int32_t)buffer.minValue()) / 2;
}

ThresholdEstimator::ThresholdEstimator(uint16_t interval)
    : interval(interval), cycles(0), current(0) {
}

bool ThresholdEstimator::update(const RawBuffer& rawRed) {
    cycles++;
    if (cycles > interval) {
        current = midpointThreshold(rawRed);
        cycles = 0;
        return true;
    }
    return false;
}
