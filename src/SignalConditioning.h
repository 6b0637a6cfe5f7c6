#pragma once

#include <stdint.h>
#include "PpgTypes.h"

// Widen an ADC reading to toBits, copying its top bits into the new low bits
// so zero stays 0 and full scale maps to full scale. toBits <= 2 * fromBits.
uint16_t widenReading(uint16_t reading, int fromBits, int toBits);

// Clamp a raw reading into [minValue, maxValue]
uint16_t clipSample(uint16_t raw, uint16_t minValue, uint16_t maxValue);

// Map a clipped reading onto 0..scale for plotting. An empty range maps to 0.
uint8_t normalizeSample(uint16_t clipped, uint16_t minValue, uint16_t maxValue, uint8_t scale);

ConditionedSample conditionSample(const SamplePair& raw,
                                  const ChannelRange& red,
                                  const ChannelRange& ir,
                                  uint8_t scale);
