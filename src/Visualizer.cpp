#include "Visualizer.h"

#include <stdio.h>

void formatBpmLabel(char* buf, size_t len, int bpm) {
    snprintf(buf, len, "Pulse: %d bpm", bpm);
}

void formatSpO2Label(char* buf, size_t len, float spo2) {
    snprintf(buf, len, "SpO2: %.1f%%", spo2);
}

Visualizer::Visualizer(DisplaySurface& surface) : surface(surface) {
}

void Visualizer::render(const FrameData& frame) {
    char buf[32];

    surface.clear();

    formatBpmLabel(buf, sizeof(buf), frame.bpm);
    surface.drawText(buf, 0, BPM_TEXT_Y);
    formatSpO2Label(buf, sizeof(buf), frame.spo2);
    surface.drawText(buf, 0, SPO2_TEXT_Y);

    // Red plot sits under the text, IR plot on the bottom rows
    surface.drawText("RD", 0, GRAPH_HEIGHT + 8);
    if (frame.graphRed) plot(*frame.graphRed, GRAPH_HEIGHT + RED_PLOT_Y_OFFSET);

    surface.drawText("IR", 0, surface.height() - 8);
    if (frame.graphIr) plot(*frame.graphIr, surface.height() - 1);

    surface.flush();
}

void Visualizer::plot(const GraphBuffer& graph, int baseY) {
    // oldest sample on the left, larger values drawn higher
    for (size_t x = 0; x < graph.size(); x++) {
        setPixel(GRAPH_X_OFFSET + (int)x, baseY - graph.at(x));
    }
}

void Visualizer::setPixel(int x, int y) {
    if (x < 0 || x >= surface.width() || y < 0 || y >= surface.height()) return;
    surface.drawPixel(x, y, true);
}
