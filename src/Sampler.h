#pragma once

#include <stdint.h>
#include "OximeterConfig.h"
#include "PpgTypes.h"

// ===== Capabilities =====

// Monotonic millisecond clock plus a blocking wait
class Timebase {
public:
    virtual ~Timebase() {}
    virtual uint32_t millis() = 0;
    virtual void delayMs(uint32_t ms) = 0;
};

// Emitter outputs and the shared photodetector
class OpticalFrontEnd {
public:
    virtual ~OpticalFrontEnd() {}
    virtual void setEmitter(Channel channel, bool on) = 0;
    virtual uint16_t readDetector() = 0;
};

// Anything that can deliver one reading per channel
class PpgSource {
public:
    virtual ~PpgSource() {}
    virtual uint16_t strobeAndRead(Channel channel) = 0;

    // Red first, then IR
    SamplePair sampleCycle();
};

// ===== Sampler =====

/*
  Strobe protocol for one channel:
    emitter on -> settle wait -> read -> emitter off
  Only one emitter is ever on, and every read follows its own settle wait.
*/
class Sampler : public PpgSource {
public:
    Sampler(OpticalFrontEnd& frontEnd, Timebase& clock, uint32_t settleMs = SETTLE_DELAY_MS);

    void begin();
    uint16_t strobeAndRead(Channel channel) override;

private:
    OpticalFrontEnd& frontEnd;
    Timebase& clock;
    uint32_t settleMs;
};
