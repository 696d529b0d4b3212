/// @file I2cScanner.h
/// @brief I2C bus scanner for bring-up
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "I2cBridge/Address.h"
#include "Log.h"

namespace i2c {

/// Scan the usable 7-bit range (reserved addresses are skipped)
/// @return Number of devices found
inline int scan() {
  LOGI("Scanning I2C bus (0x08-0x77)...");

  int count = 0;
  for (uint16_t raw = 0; raw <= 0x7F; raw++) {
    I2cBridge::SevenBitAddr addr;
    if (!I2cBridge::SevenBitAddr::tryNew(static_cast<uint8_t>(raw), addr).ok()) {
      continue;
    }
    Wire.beginTransmission(addr.get());
    if (Wire.endTransmission() == 0) {
      Serial.printf("  Found device at 0x%02X\n", addr.get());
      count++;
    }
  }

  if (count == 0) {
    LOGW("No I2C devices found");
  } else {
    LOGI("Found %d device(s)", count);
  }
  return count;
}

/// Check if a specific address responds
inline bool checkAddress(uint8_t addr) {
  Wire.beginTransmission(addr);
  return Wire.endTransmission() == 0;
}

} // namespace i2c
