#include "OximeterPipeline.h"

#include "SpO2Estimator.h"

PipelineConfig PipelineConfig::defaults() {
    PipelineConfig c;
    c.red.minValue = RED_MIN_VALUE;
    c.red.maxValue = RED_MAX_VALUE;
    c.ir.minValue = IR_MIN_VALUE;
    c.ir.maxValue = IR_MAX_VALUE;
    c.graphScale = GRAPH_HEIGHT;
    c.thresholdInterval = THRESHOLD_INTERVAL;
    c.bpmMin = BPM_MIN;
    c.bpmMax = BPM_MAX;
    return c;
}

bool PipelineConfig::isValid() const {
    if (!red.isValid() || !ir.isValid()) return false;
    if (bpmMin >= bpmMax) return false;
    // the graph buffers hold 0..graphScale
    if (graphScale > GRAPH_HEIGHT) return false;
    return true;
}

OximeterPipeline::OximeterPipeline(const PipelineConfig& config)
    : cfg(config.isValid() ? config : PipelineConfig::defaults()),
      fellBack(!config.isValid()),
      thresholds(cfg.thresholdInterval),
      detector(cfg.bpmMin, cfg.bpmMax),
      lastSpO2(0) {
}

CycleReport OximeterPipeline::step(const SamplePair& raw, uint32_t nowMs) {
    CycleReport r;
    r.raw = raw;
    r.conditioned = conditionSample(raw, cfg.red, cfg.ir, cfg.graphScale);

    signals.push(raw, r.conditioned);

    r.thresholdUpdated = thresholds.update(signals.rawRed());
    r.threshold = thresholds.threshold();

    r.peak = detector.update(signals.rawRed(), r.threshold, nowMs);
    r.bpm = detector.bpm();

    lastSpO2 = calculateSpO2(r.conditioned.redClipped, r.conditioned.irClipped,
                             cfg.red.maxValue, cfg.ir.maxValue);
    r.spo2 = lastSpO2;
    return r;
}
