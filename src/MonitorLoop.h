#pragma once

#include <stdint.h>
#include "OximeterConfig.h"
#include "OximeterPipeline.h"
#include "Sampler.h"
#include "Visualizer.h"

/*
  One pass of the measuring loop:
    sample -> step the pipeline -> render -> tail delay
  Compute and render time are not subtracted from the tail delay, so the
  cycle rate drifts with load.
*/
class MonitorLoop {
public:
    MonitorLoop(PpgSource& source, Timebase& clock, OximeterPipeline& pipeline,
                FrameSink& sink, uint32_t tailDelayMs = LOOP_DELAY_MS);

    CycleReport runCycle();

private:
    PpgSource& source;
    Timebase& clock;
    OximeterPipeline& pipeline;
    FrameSink& sink;
    uint32_t tailDelayMs;
};
