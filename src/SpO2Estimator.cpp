#include "SpO2Estimator.h"

float calculateSpO2(uint16_t redClipped, uint16_t irClipped,
                    uint16_t redMax, uint16_t irMax) {
    if (irClipped == 0) return 0;

    float R = ((float)redClipped / redMax) / ((float)irClipped / irMax);
    return 110 - 25 * R;
}
