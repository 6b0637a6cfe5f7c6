#include <Arduino.h>
#include <Wire.h>
#include <U8g2lib.h>

#include "OximeterConfig.h"
#include "MonitorLoop.h"
#include "OximeterPipeline.h"
#include "Sampler.h"
#include "SignalConditioning.h"
#include "Visualizer.h"

/*
  Two-LED pulse oximeter
  - Red (660 nm) and IR (940 nm) LEDs strobed in turn over one phototransistor
  - BPM from hysteresis peak timing on the red channel
  - SpO2 from the red/IR ratio of each cycle
  - SSD1306 128x64: readings plus one scrolling plot per channel
*/

// ===== OLED =====
// SSD1306 128x64 using hardware I2C
U8G2_SSD1306_128X64_NONAME_F_HW_I2C u8g2(U8G2_R0, /* reset=*/ U8X8_PIN_NONE);

// ===== Hardware bindings =====
class PicoFrontEnd : public OpticalFrontEnd {
public:
    void begin() {
        pinMode(RED_LED_PIN, OUTPUT);
        pinMode(IR_LED_PIN, OUTPUT);
        analogReadResolution(ADC_RESOLUTION_BITS);
    }

    void setEmitter(Channel channel, bool on) override {
        digitalWrite(channel == CHANNEL_RED ? RED_LED_PIN : IR_LED_PIN, on ? HIGH : LOW);
    }

    uint16_t readDetector() override {
        // the configured ranges are in 16-bit units
        return widenReading(analogRead(PHOTO_PIN), ADC_RESOLUTION_BITS, ADC_SCALED_BITS);
    }
};

class ArduinoTimebase : public Timebase {
public:
    uint32_t millis() override { return ::millis(); }
    void delayMs(uint32_t ms) override { ::delay(ms); }
};

class U8g2Surface : public DisplaySurface {
public:
    explicit U8g2Surface(U8G2& display) : display(display) {}

    void clear() override { display.clearBuffer(); }

    void drawText(const char* text, int x, int y) override {
        display.setDrawColor(1);
        display.drawStr(x, y, text);
    }

    void drawPixel(int x, int y, bool on) override {
        display.setDrawColor(on ? 1 : 0);
        display.drawPixel(x, y);
    }

    void flush() override { display.sendBuffer(); }
    int width() const override { return OLED_WIDTH; }
    int height() const override { return OLED_HEIGHT; }

private:
    U8G2& display;
};

// ===== Pipeline =====
PicoFrontEnd frontEnd;
ArduinoTimebase timebase;
U8g2Surface surface(u8g2);
Sampler sampler(frontEnd, timebase, SETTLE_DELAY_MS);
Visualizer visualizer(surface);
OximeterPipeline pipeline(PipelineConfig::defaults());
MonitorLoop monitor(sampler, timebase, pipeline, visualizer, LOOP_DELAY_MS);

// ===== Timing =====
unsigned long lastTelemetry = 0;

// ===== Function prototypes =====
void logCycle(const CycleReport& report);

// ===== Setup =====
void setup() {
    Serial.begin(115200);
    Serial.println("\n=== PPG Oximeter ===");

    frontEnd.begin();
    sampler.begin();

    Wire.setSDA(OLED_SDA_PIN);
    Wire.setSCL(OLED_SCL_PIN);
    Wire.begin();
    Wire.setClock(I2C_CLOCK_HZ);

    if (!u8g2.begin()) {
        // keep measuring, readings still go to Serial
        Serial.println("Display Error!");
    }
    u8g2.setFont(u8g2_font_5x8_tr);
    u8g2.setFontPosTop();
    u8g2.clearBuffer();
    u8g2.drawStr(10, 28, "Initializing...");
    u8g2.sendBuffer();

    if (pipeline.configRejected()) {
        Serial.println("Invalid channel or BPM configuration, using defaults");
    }

    Serial.println("Front end ready");
}

// ===== Main Loop =====
void loop() {
    CycleReport report = monitor.runCycle();
    logCycle(report);
}

// ===== Serial log =====
void logCycle(const CycleReport& report) {
    if (report.thresholdUpdated) {
        Serial.print("Threshold: ");
        Serial.println(report.threshold);
    }

    if (report.peak.completed && report.peak.intervalMs > 0) {
        Serial.print("Peak interval: ");
        Serial.print(report.peak.intervalMs);
        Serial.print(" ms -> ");
        Serial.print(report.peak.candidateBpm);
        Serial.println(report.peak.accepted ? " bpm accepted" : " bpm rejected");
    }

    unsigned long now = millis();
    if (now - lastTelemetry >= TELEMETRY_PERIOD_MS) {
        lastTelemetry = now;
        Serial.print("BPM: "); Serial.print(report.bpm);
        Serial.print(" | SpO2: "); Serial.print(report.spo2, 1); Serial.println("%");
    }
}

