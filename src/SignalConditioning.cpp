#include "SignalConditioning.h"

uint16_t widenReading(uint16_t reading, int fromBits, int toBits) {
    int shift = toBits - fromBits;
    if (shift <= 0) return reading;
    return (uint16_t)((reading << shift) | (reading >> (fromBits - shift)));
}

uint16_t clipSample(uint16_t raw, uint16_t minValue, uint16_t maxValue) {
    if (raw > maxValue) raw = maxValue;
    if (raw < minValue) raw = minValue;
    return raw;
}

uint8_t normalizeSample(uint16_t clipped, uint16_t minValue, uint16_t maxValue, uint8_t scale) {
    if (maxValue <= minValue || clipped <= minValue) return 0;
    // truncation is a floor here: clipped >= minValue
    float fraction = (float)(clipped - minValue) / (float)(maxValue - minValue);
    return (uint8_t)(fraction * scale);
}

ConditionedSample conditionSample(const SamplePair& raw,
                                  const ChannelRange& red,
                                  const ChannelRange& ir,
                                  uint8_t scale) {
    ConditionedSample out;
    out.redClipped = clipSample(raw.red, red.minValue, red.maxValue);
    out.irClipped = clipSample(raw.ir, ir.minValue, ir.maxValue);
    out.redGraph = normalizeSample(out.redClipped, red.minValue, red.maxValue, scale);
    out.irGraph = normalizeSample(out.irClipped, ir.minValue, ir.maxValue, scale);
    return out;
}
