/// @file I2cTransport.h
/// @brief Wire-based device transport for the examples
/// @note NOT part of the library - examples only
#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "I2cBridge/Config.h"
#include "I2cBridge/ResponseCode.h"

namespace transport {

using I2cBridge::DeviceConfig;
using I2cBridge::DeviceTarget;
using I2cBridge::ResponseCode;

/// Initialize Wire for examples
/// @param sda SDA pin
/// @param scl SCL pin
/// @param freqHz I2C clock frequency
/// @param timeoutMs Wire timeout in milliseconds
/// @return true if initialized
inline bool initWire(int sda, int scl, uint32_t freqHz, uint32_t timeoutMs) {
  Wire.begin(sda, scl);
  Wire.setClock(freqHz);
  Wire.setTimeOut(timeoutMs);
  return true;
}

/// Map an Arduino Wire endTransmission() result onto a response code.
/// Codes are core-dependent: 1=data too long, 2=NACK addr, 3=NACK data,
/// 4=other, 5=timeout (ESP32 Arduino core).
inline ResponseCode mapWireResult(uint8_t result) {
  switch (result) {
    case 0: return ResponseCode::SUCCESS;
    case 1: return ResponseCode::TOO_MUCH_DATA;
    case 2: return ResponseCode::ADDRESS_NACK_SENT_EARLY;
    case 3: return ResponseCode::DATA_NACK_SENT;
    case 4: return ResponseCode::BUS_ERROR;
    case 5: return ResponseCode::BUS_TIMEOUT;
    default: return ResponseCode::BAD_RESPONSE;
  }
}

/// Plain Wire has no multiplexer support
inline bool reachable(const DeviceTarget& target) { return !target.hasSegment; }

/// Read exactly what requestFrom() delivered into buf
inline size_t drainInto(uint8_t* buf, size_t len, size_t available) {
  size_t copied = 0;
  for (size_t i = 0; i < available; i++) {
    const int value = Wire.read();
    if (copied < len) {
      buf[copied++] = static_cast<uint8_t>(value);
    }
  }
  return copied;
}

/// Device write callback
inline ResponseCode wireWrite(const DeviceTarget& target, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;
  if (!reachable(target)) {
    return ResponseCode::OPERATION_NOT_SUPPORTED;
  }

  Wire.beginTransmission(target.address);
  const size_t written = Wire.write(data, len);
  const ResponseCode rc = mapWireResult(Wire.endTransmission(true));
  if (rc != ResponseCode::SUCCESS) {
    return rc;
  }
  if (written != len) {
    return ResponseCode::TOO_MUCH_DATA;
  }
  return ResponseCode::SUCCESS;
}

/// Device read callback
inline ResponseCode wireRead(const DeviceTarget& target, uint8_t* buf, size_t len,
                             size_t& received, uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;
  received = 0;
  if (!reachable(target)) {
    return ResponseCode::OPERATION_NOT_SUPPORTED;
  }
  if (len == 0) {
    return ResponseCode::SUCCESS;
  }

  const size_t got = Wire.requestFrom(target.address, len);
  if (got == 0) {
    // Wire cannot tell an address NACK from an empty read
    return ResponseCode::ADDRESS_NACK_SENT_EARLY;
  }
  received = drainInto(buf, len, got);
  return ResponseCode::SUCCESS;
}

/// Register read callback: register select and read with a repeated START
inline ResponseCode wireReadReg(const DeviceTarget& target, const uint8_t* reg, size_t regLen,
                                uint8_t* buf, size_t len, size_t& received,
                                uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;
  received = 0;
  if (!reachable(target)) {
    return ResponseCode::OPERATION_NOT_SUPPORTED;
  }

  Wire.beginTransmission(target.address);
  Wire.write(reg, regLen);
  const ResponseCode rc = mapWireResult(Wire.endTransmission(false));
  if (rc != ResponseCode::SUCCESS) {
    return rc;
  }
  if (len == 0) {
    return ResponseCode::SUCCESS;
  }

  const size_t got = Wire.requestFrom(target.address, len);
  if (got == 0) {
    return ResponseCode::ADDRESS_NACK_SENT_LATE;
  }
  received = drainInto(buf, len, got);
  return ResponseCode::SUCCESS;
}

/// SMBus block read callback: the first byte read back is the byte count
inline ResponseCode wireReadBlock(const DeviceTarget& target, const uint8_t* reg, size_t regLen,
                                  uint8_t* buf, size_t len, size_t& received,
                                  uint32_t timeoutMs, void* user) {
  (void)user;
  (void)timeoutMs;
  received = 0;
  if (!reachable(target)) {
    return ResponseCode::OPERATION_NOT_SUPPORTED;
  }

  Wire.beginTransmission(target.address);
  Wire.write(reg, regLen);
  const ResponseCode rc = mapWireResult(Wire.endTransmission(false));
  if (rc != ResponseCode::SUCCESS) {
    return rc;
  }

  const size_t got = Wire.requestFrom(target.address, len + 1);
  if (got == 0) {
    return ResponseCode::ADDRESS_NACK_SENT_LATE;
  }
  const size_t count = static_cast<uint8_t>(Wire.read());
  const size_t copied = drainInto(buf, len, got - 1);
  if (count > len) {
    return ResponseCode::TOO_MUCH_DATA;
  }
  received = count < copied ? count : copied;
  return ResponseCode::SUCCESS;
}

/// DeviceConfig wired to the callbacks above
inline DeviceConfig wireDeviceConfig(const DeviceTarget& target, uint32_t timeoutMs) {
  DeviceConfig cfg;
  cfg.target = target;
  cfg.write = wireWrite;
  cfg.readInto = wireRead;
  cfg.readRegInto = wireReadReg;
  cfg.readBlock = wireReadBlock;
  cfg.user = nullptr;
  cfg.timeoutMs = timeoutMs;
  return cfg;
}

/// Blocking sleep for RetryConfig::delayMs
inline void arduinoDelay(uint32_t delayMs, void* user) {
  (void)user;
  delay(delayMs);
}

/// Millisecond clock for HealthConfig::nowMs
inline uint32_t arduinoMillis(void* user) {
  (void)user;
  return millis();
}

} // namespace transport
