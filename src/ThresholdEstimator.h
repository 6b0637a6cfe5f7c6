#pragma once

#include <stdint.h>
#include "OximeterConfig.h"
#include "SignalBuffer.h"

// Midpoint of the buffer's range
int32_t midpointThreshold(const RawBuffer& buffer);

/*
  Sticky detection threshold.
  The cycle counter is compared with '>' so the threshold is refreshed on
  every (interval + 1)th cycle, then held until the next refresh.
*/
class ThresholdEstimator {
public:
    explicit ThresholdEstimator(uint16_t interval = THRESHOLD_INTERVAL);

    // Call once per cycle after the buffer update. Returns true on a refresh.
    bool update(const RawBuffer& rawRed);

    int32_t threshold() const { return current; }
    uint16_t counter() const { return cycles; }

private:
    uint16_t interval;
    uint16_t cycles;
    int32_t current;
};
