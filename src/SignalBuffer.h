#pragma once

#include <stdint.h>
#include "OximeterConfig.h"
#include "PpgTypes.h"
#include "RollingBuffer.h"

typedef RollingBuffer<uint16_t, RAW_BUFFER_SIZE> RawBuffer;
typedef RollingBuffer<uint8_t, GRAPH_WIDTH> GraphBuffer;

// Raw histories feed detection, graph histories feed the display
class SignalBuffer {
public:
    void push(const SamplePair& raw, const ConditionedSample& conditioned);

    const RawBuffer& rawRed() const { return redRaw; }
    const RawBuffer& rawIr() const { return irRaw; }
    const GraphBuffer& graphRed() const { return redGraph; }
    const GraphBuffer& graphIr() const { return irGraph; }

private:
    RawBuffer redRaw;
    RawBuffer irRaw;
    GraphBuffer redGraph;
    GraphBuffer irGraph;
};
