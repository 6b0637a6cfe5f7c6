#pragma once

#include <stdint.h>
#include "OximeterConfig.h"
#include "PeakDetector.h"
#include "PpgTypes.h"
#include "SignalBuffer.h"
#include "SignalConditioning.h"
#include "ThresholdEstimator.h"

// Runtime-relevant configuration. Buffer capacities stay compile-time.
struct PipelineConfig {
    ChannelRange red;
    ChannelRange ir;
    uint8_t graphScale;
    uint16_t thresholdInterval;
    int bpmMin;
    int bpmMax;

    static PipelineConfig defaults();
    bool isValid() const;
};

// What happened in one cycle, for logging
struct CycleReport {
    SamplePair raw;
    ConditionedSample conditioned;
    bool thresholdUpdated;
    int32_t threshold;
    PeakUpdate peak;
    int bpm;
    float spo2;
};

/*
  All per-cycle state of the measurement: rolling buffers, threshold and
  its counter, peak state, sticky BPM and the latest SpO2.
  step() applies one cycle as a single update.
  An invalid config is replaced by PipelineConfig::defaults().
*/
class OximeterPipeline {
public:
    explicit OximeterPipeline(const PipelineConfig& config = PipelineConfig::defaults());

    CycleReport step(const SamplePair& raw, uint32_t nowMs);

    const PipelineConfig& config() const { return cfg; }
    bool configRejected() const { return fellBack; }
    const SignalBuffer& buffers() const { return signals; }
    int32_t threshold() const { return thresholds.threshold(); }
    uint16_t thresholdCounter() const { return thresholds.counter(); }
    int bpm() const { return detector.bpm(); }
    float spo2() const { return lastSpO2; }

private:
    PipelineConfig cfg;
    bool fellBack;
    SignalBuffer signals;
    ThresholdEstimator thresholds;
    PeakDetector detector;
    float lastSpO2;
};
