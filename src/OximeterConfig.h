#pragma once

#include <stdint.h>

/*
  Fixed configuration for the two-LED / phototransistor oximeter.
  Reference build: Raspberry Pi Pico, SSD1306 128x64 over I2C.
*/

// ===== Pins =====
#define RED_LED_PIN 21      // 660 nm emitter
#define IR_LED_PIN 20       // 940 nm emitter
#define PHOTO_PIN 26        // phototransistor (ADC0)
#define OLED_SDA_PIN 4
#define OLED_SCL_PIN 5
#define I2C_CLOCK_HZ 400000

// ===== ADC =====
// Readings are scaled up to 16 bits so the ranges below are resolution independent
#define ADC_RESOLUTION_BITS 12
#define ADC_SCALED_BITS 16

// ===== Channel ranges (16-bit scale) =====
#define RED_MIN_VALUE 700
#define RED_MAX_VALUE 14000
#define IR_MIN_VALUE 500
#define IR_MAX_VALUE 1300

// ===== Buffers =====
#define RAW_BUFFER_SIZE 100

// ===== OLED =====
#define OLED_WIDTH 128
#define OLED_HEIGHT 64

// Plot layout: labels on the left, one plot per channel stacked vertically
const int GRAPH_X_OFFSET = 20;
const int GRAPH_WIDTH = OLED_WIDTH - GRAPH_X_OFFSET;
const int GRAPH_HEIGHT = (OLED_HEIGHT - 20) / 2;
const int RED_PLOT_Y_OFFSET = 16;
const int BPM_TEXT_Y = 0;
const int SPO2_TEXT_Y = 10;

// ===== Detection =====
#define THRESHOLD_INTERVAL 50   // recompute once the counter exceeds this
#define BPM_MIN 40              // exclusive
#define BPM_MAX 160             // exclusive

// ===== Timing =====
#define SETTLE_DELAY_MS 5
#define LOOP_DELAY_MS 50
#define TELEMETRY_PERIOD_MS 1000

static_assert(RED_MIN_VALUE < RED_MAX_VALUE, "red range is empty");
static_assert(IR_MIN_VALUE < IR_MAX_VALUE, "IR range is empty");
static_assert(IR_MIN_VALUE > 0, "IR minimum must be positive");
static_assert(BPM_MIN < BPM_MAX, "BPM plausibility band is empty");
static_assert(GRAPH_WIDTH > 0 && GRAPH_HEIGHT > 0, "plot area does not fit the display");
static_assert(RED_PLOT_Y_OFFSET + GRAPH_HEIGHT < OLED_HEIGHT, "red plot overflows the display");
