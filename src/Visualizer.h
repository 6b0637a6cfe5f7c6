#pragma once

#include <stddef.h>
#include <stdint.h>
#include "OximeterConfig.h"
#include "SignalBuffer.h"

// ===== Display surface =====

// Monochrome frame buffer, origin top-left, text positioned by its top edge
class DisplaySurface {
public:
    virtual ~DisplaySurface() {}
    virtual void clear() = 0;
    virtual void drawText(const char* text, int x, int y) = 0;
    virtual void drawPixel(int x, int y, bool on) = 0;
    virtual void flush() = 0;
    virtual int width() const = 0;
    virtual int height() const = 0;
};

// ===== Frame sink =====

struct FrameData {
    int bpm;
    float spo2;
    const GraphBuffer* graphRed;
    const GraphBuffer* graphIr;
};

class FrameSink {
public:
    virtual ~FrameSink() {}
    virtual void render(const FrameData& frame) = 0;
};

// ===== Labels =====
void formatBpmLabel(char* buf, size_t len, int bpm);
void formatSpO2Label(char* buf, size_t len, float spo2);

// ===== Visualizer =====

/*
  Full redraw every frame:
    Pulse: N bpm        (0, 0)
    SpO2: X.X%          (0, 10)
    RD  ~~~~ red plot   rows 16..38
    IR  ~~~~ IR plot    rows 41..63
*/
class Visualizer : public FrameSink {
public:
    explicit Visualizer(DisplaySurface& surface);

    void render(const FrameData& frame) override;

private:
    void plot(const GraphBuffer& graph, int baseY);
    void setPixel(int x, int y);

    DisplaySurface& surface;
};
