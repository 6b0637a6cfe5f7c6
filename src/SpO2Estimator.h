#pragma once

#include <stdint.h>

/*
  Empirical ratio-of-ratios estimate: 110 - 25 * R, where
  R = (red / redMax) / (ir / irMax) on the clipped readings.
  Returns 0 when ir is 0. The result is not smoothed or clamped.
*/
float calculateSpO2(uint16_t redClipped, uint16_t irClipped,
                    uint16_t redMax, uint16_t irMax);
