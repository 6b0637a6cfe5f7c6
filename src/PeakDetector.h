#pragma once

#include <stdint.h>
#include "OximeterConfig.h"
#include "SignalBuffer.h"

// ===== Hysteresis state machine =====

enum PeakPhase {
    PEAK_IDLE,
    PEAK_RISING
};

// startMs is only meaningful while RISING
struct PeakState {
    PeakPhase phase;
    uint32_t startMs;
};

struct HysteresisBand {
    int32_t upper;
    int32_t lower;
};

struct PeakTransition {
    PeakState next;
    bool started;            // IDLE -> RISING this step
    bool completed;          // RISING -> IDLE this step
    uint32_t intervalMs;     // start-to-stop time, valid when completed
};

// band = (max - threshold) / 3, floored; it collapses to zero when max == threshold
HysteresisBand computeBand(int32_t bufferMax, int32_t threshold);

// Pure transition. Both edges are tested in order, so a negative band can open
// and close an interval in the same step (with a zero-length interval).
PeakTransition stepPeakState(const PeakState& state, int32_t latest,
                             const HysteresisBand& band, uint32_t nowMs);

// 60000 / intervalMs, or 0 for an empty interval
int bpmFromInterval(uint32_t intervalMs);

// ===== Detector =====

struct PeakUpdate {
    HysteresisBand band;
    bool started;
    bool completed;
    uint32_t intervalMs;
    int candidateBpm;        // 0 unless an interval completed
    bool accepted;           // candidate replaced the sticky BPM
};

class PeakDetector {
public:
    PeakDetector(int bpmMin = BPM_MIN, int bpmMax = BPM_MAX);

    // Evaluate the newest raw-red sample against the live band
    PeakUpdate update(const RawBuffer& rawRed, int32_t threshold, uint32_t nowMs);

    int bpm() const { return currentBpm; }
    const PeakState& state() const { return peak; }
    bool isPlausible(int candidate) const;

private:
    int bpmMin;
    int bpmMax;
    PeakState peak;
    int currentBpm;
};
