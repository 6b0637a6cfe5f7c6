#include "SignalBuffer.h"

void SignalBuffer::push(const SamplePair& raw, const ConditionedSample& conditioned) {
    // detection works on the unclipped readings
    redRaw.push(raw.red);
    irRaw.push(raw.ir);
    redGraph.push(conditioned.redGraph);
    irGraph.push(conditioned.irGraph);
}
