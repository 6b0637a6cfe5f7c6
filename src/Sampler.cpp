#include "Sampler.h"

SamplePair PpgSource::sampleCycle() {
    SamplePair s;
    s.red = strobeAndRead(CHANNEL_RED);
    s.ir = strobeAndRead(CHANNEL_IR);
    return s;
}

Sampler::Sampler(OpticalFrontEnd& frontEnd, Timebase& clock, uint32_t settleMs)
    : frontEnd(frontEnd), clock(clock), settleMs(settleMs) {
}

void Sampler::begin() {
    frontEnd.setEmitter(CHANNEL_RED, false);
    frontEnd.setEmitter(CHANNEL_IR, false);
}

uint16_t Sampler::strobeAndRead(Channel channel) {
    frontEnd.setEmitter(channel, true);
    clock.delayMs(settleMs);        // let the phototransistor stabilize
    uint16_t value = frontEnd.readDetector();
    frontEnd.setEmitter(channel, false);
    return value;
}
