#pragma once

// -----------------------------
// Project: LED Matrix Clock (MAX7219 chain on a Linux SBC)
// Scope: clock + temperature + date ticker + day/night dimming + small animations
// Every default below can be overridden at runtime through the LED_* environment.
// -----------------------------

// ===== VERSION =====
#define FIRMWARE_VERSION "1.0.0"

// ===== LED MATRIX (MAX7219) =====
// One module is an 8x8 block; a cascade is a chain of modules in a single row.
#define MATRIX_BLOCK_SIZE 8

#define DEFAULT_SPI_PORT      0
#define DEFAULT_SPI_DEVICE    0
#define DEFAULT_BUS_HZ        16000000
#define DEFAULT_CASCADED      4
#define DEFAULT_ORIENTATION   -90     // per-block rotation: -90, 0, 90, 180
#define DEFAULT_ROTATE        0       // whole display, 0..3 (x90 deg clockwise)

// ===== FONTS =====
#define FONT_TINY 1
#define FONT_TALL 2
#define DEFAULT_TIME_FONT   FONT_TINY
#define DEFAULT_TICKER_FONT FONT_TINY

// ===== TIME / COLON =====
#define DEFAULT_TIME_FMT     "%H:%M"
#define DEFAULT_BLINK_COLON  true
#define DEFAULT_COLON_VGAP   2

// ===== TEMPERATURE =====
#define DEFAULT_DRAW_TEMP    true
#define DEFAULT_TEMP_SHOW_C  true
#define TEMP_MIN_C           -99
#define TEMP_MAX_C           199

#ifndef THERMAL_ZONE_PATH
#define THERMAL_ZONE_PATH "/sys/class/thermal/thermal_zone0/temp"
#endif

#ifndef VCGENCMD_COMMAND
#define VCGENCMD_COMMAND "vcgencmd measure_temp 2>/dev/null"
#endif

// ===== DATE TICKER =====
#define DEFAULT_TICKER_EVERY      60.0f   // seconds between scrolls
#define DEFAULT_TICKER_SPEED      0.07f   // seconds per pixel
#define DEFAULT_TICKER_GAP        16      // blank pixels after the text
#define DEFAULT_TICKER_WITH_YEAR  true

// ===== AUTO BRIGHTNESS =====
#define DEFAULT_AUTO_DIM          true
#define DEFAULT_BRIGHTNESS_DAY    12      // 0..255
#define DEFAULT_BRIGHTNESS_NIGHT  3       // 0..255
#define DEFAULT_NIGHT_FROM_H      22
#define DEFAULT_NIGHT_FROM_M      30
#define DEFAULT_NIGHT_TO_H        7
#define DEFAULT_NIGHT_TO_M        0

// ===== VISUAL ADD-ONS =====
#define DEFAULT_SECONDS_BAR         true
#define DEFAULT_SECONDS_BAR_DOTTED  false

#define DEFAULT_SPARKLE_ON_HOUR   true
#define DEFAULT_SPARKLE_DURATION  0.45f
#define DEFAULT_SPARKLE_DENSITY   0.15f
#define DEFAULT_SPARKLE_FPS       20

#define DEFAULT_MINUTE_SWIPE        true
#define DEFAULT_MINUTE_SWIPE_PX     8
#define DEFAULT_MINUTE_SWIPE_DELAY  0.03f

// ===== RENDER =====
#define FRAME_MS 200   // idle sleep between normal frames
