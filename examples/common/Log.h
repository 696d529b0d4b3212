/// @file Log.h
/// @brief Serial console logging for the example sketches
/// @note NOT part of the library - the library never logs; diagnostics travel in Status
#pragma once

#include <Arduino.h>

/// Compile-time threshold: 0 = errors, 1 = +warnings, 2 = +info, 3 = +debug
#ifndef I2CBRIDGE_EXAMPLE_LOG_LEVEL
#define I2CBRIDGE_EXAMPLE_LOG_LEVEL 2
#endif

/// Open the console; waits up to 2 s for a USB-CDC host to attach
inline void log_begin(unsigned long baud) {
  Serial.begin(baud);
  const unsigned long start = millis();
  while (!Serial && (millis() - start) < 2000UL) {
    delay(10);
  }
}

/// "<ms> [<tag>] message"
#define I2CBRIDGE_LOG_LINE(tag, fmt, ...) \
  Serial.printf("%8lu [" tag "] " fmt "\n", static_cast<unsigned long>(millis()), ##__VA_ARGS__)

#define I2CBRIDGE_LOG_AT(level, tag, fmt, ...)                 \
  do {                                                         \
    if ((level) <= I2CBRIDGE_EXAMPLE_LOG_LEVEL) {              \
      I2CBRIDGE_LOG_LINE(tag, fmt, ##__VA_ARGS__);             \
    }                                                          \
  } while (0)

#define LOGE(fmt, ...) I2CBRIDGE_LOG_AT(0, "E", fmt, ##__VA_ARGS__)
#define LOGW(fmt, ...) I2CBRIDGE_LOG_AT(1, "W", fmt, ##__VA_ARGS__)
#define LOGI(fmt, ...) I2CBRIDGE_LOG_AT(2, "I", fmt, ##__VA_ARGS__)
#define LOGD(fmt, ...) I2CBRIDGE_LOG_AT(3, "D", fmt, ##__VA_ARGS__)

/// Runtime-gated output (the CLI's `verbose` switch); ignores the level
#define LOGV(verbose, fmt, ...)                  \
  do {                                           \
    if (verbose) {                               \
      I2CBRIDGE_LOG_LINE("V", fmt, ##__VA_ARGS__); \
    }                                            \
  } while (0)
