#include "PeakDetector.h"

static int32_t floorDiv(int32_t a, int32_t b) {
    int32_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) q--;
    return q;
}

HysteresisBand computeBand(int32_t bufferMax, int32_t threshold) {
    // max can sit below a stale threshold, which makes the band negative
    int32_t band = floorDiv(bufferMax - threshold, 3);
    HysteresisBand out;
    out.upper = threshold + band;
    out.lower = threshold - band;
    return out;
}

PeakTransition stepPeakState(const PeakState& state, int32_t latest,
                             const HysteresisBand& band, uint32_t nowMs) {
    PeakTransition t;
    t.next = state;
    t.started = false;
    t.completed = false;
    t.intervalMs = 0;

    if (t.next.phase == PEAK_IDLE && latest > band.upper) {
        t.next.phase = PEAK_RISING;
        t.next.startMs = nowMs;
        t.started = true;
    }

    if (t.next.phase == PEAK_RISING && latest < band.lower) {
        t.next.phase = PEAK_IDLE;
        t.completed = true;
        // unsigned subtraction stays correct across a millis() wrap
        t.intervalMs = nowMs - t.next.startMs;
        t.next.startMs = 0;
    }

    return t;
}

int bpmFromInterval(uint32_t intervalMs) {
    if (intervalMs == 0) return 0;
    return (int)(60000UL / intervalMs);
}

PeakDetector::PeakDetector(int bpmMin, int bpmMax)
    : bpmMin(bpmMin), bpmMax(bpmMax), currentBpm(0) {
    peak.phase = PEAK_IDLE;
    peak.startMs = 0;
}

bool PeakDetector::isPlausible(int candidate) const {
    return candidate > bpmMin && candidate < bpmMax;
}

PeakUpdate PeakDetector::update(const RawBuffer& rawRed, int32_t threshold, uint32_t nowMs) {
    PeakUpdate u;
    u.band = computeBand(rawRed.maxValue(), threshold);
    u.candidateBpm = 0;
    u.accepted = false;

    PeakTransition t = stepPeakState(peak, rawRed.last(), u.band, nowMs);
    peak = t.next;
    u.started = t.started;
    u.completed = t.completed;
    u.intervalMs = t.intervalMs;

    if (t.completed && t.intervalMs > 0) {
        u.candidateBpm = bpmFromInterval(t.intervalMs);
        if (isPlausible(u.candidateBpm)) {
            currentBpm = u.candidateBpm;
            u.accepted = true;
        }
    }
    return u;
}
