/**
 * @file BoardConfig.h
 * @brief Example board configuration for ESP32-S2 / ESP32-S3 reference hardware.
 *
 * Convenience defaults for the bring-up sketch only.
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library never touches pins or Wire. The device target and
 *          transport are passed in DeviceConfig.
 */

#pragma once

#include <stdint.h>

#include "I2cBridge/Config.h"
#include "common/I2cTransport.h"

namespace board {

// ====================================================================
// EXAMPLE DEFAULTS - ESP32-S2 / ESP32-S3 REFERENCE HARDWARE
// ====================================================================

/// @brief I2C SDA pin (data line).
static constexpr int I2C_SDA = 8;

/// @brief I2C SCL pin (clock line).
static constexpr int I2C_SCL = 9;

/// @brief I2C clock frequency in Hz.
static constexpr uint32_t I2C_FREQ_HZ = 400000;

/// @brief Wire timeout in milliseconds.
static constexpr uint16_t I2C_TIMEOUT_MS = 50;

/// @brief Default device: a TMP117-style temperature sensor at 0x48 on I2C0, port 0.
static constexpr uint8_t DEVICE_ADDRESS = 0x48;
static constexpr I2cBridge::Controller DEVICE_CONTROLLER = I2cBridge::Controller::I2C0;
static constexpr I2cBridge::PortIndex DEVICE_PORT = 0;

/// @brief Initialize I2C for examples using the default config.
inline bool initI2c() {
  return transport::initWire(I2C_SDA, I2C_SCL, I2C_FREQ_HZ, I2C_TIMEOUT_MS);
}

/// @brief Target for the default device.
inline I2cBridge::DeviceTarget defaultTarget() {
  return I2cBridge::DeviceTarget::simple(0, DEVICE_CONTROLLER, DEVICE_PORT, DEVICE_ADDRESS);
}

}  // namespace board
