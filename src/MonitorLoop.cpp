#include "MonitorLoop.h"

MonitorLoop::MonitorLoop(PpgSource& source, Timebase& clock, OximeterPipeline& pipeline,
                         FrameSink& sink, uint32_t tailDelayMs)
    : source(source), clock(clock), pipeline(pipeline), sink(sink), tailDelayMs(tailDelayMs) {
}

CycleReport MonitorLoop::runCycle() {
    SamplePair raw = source.sampleCycle();

    // peaks are timestamped after both reads
    CycleReport report = pipeline.step(raw, clock.millis());

    FrameData frame;
    frame.bpm = report.bpm;
    frame.spo2 = report.spo2;
    frame.graphRed = &pipeline.buffers().graphRed();
    frame.graphIr = &pipeline.buffers().graphIr();
    sink.render(frame);

    clock.delayMs(tailDelayMs);
    return report;
}
