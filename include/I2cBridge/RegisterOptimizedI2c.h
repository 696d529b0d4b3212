/// @file RegisterOptimizedI2c.h
/// @brief Fast-path dispatcher for register-oriented devices
#pragma once

#include <cstddef>
#include <cstdint>

#include "I2cBridge/DeviceBridge.h"
#include "I2cBridge/I2cBus.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

/// Decorator over a DeviceBridge that routes register-access shapes to the
/// server's one-round-trip register read:
/// - writeRead() with a one-byte write;
/// - transaction() of exactly [WRITE(1 byte), READ(n)].
/// Every other call is delegated unchanged. Success and failure are the same
/// as on the plain bridge; only the number of round trips differs.
class RegisterOptimizedI2c : public I2cBus {
public:
  RegisterOptimizedI2c() = default;
  explicit RegisterOptimizedI2c(DeviceBridge&& bridge);

  /// Bind the owned bridge's device client
  Status begin(const DeviceConfig& config) { return _bridge.begin(config); }

  DeviceBridge& bridge() { return _bridge; }
  const DeviceBridge& bridge() const { return _bridge; }

  Status read(SevenBitAddr address, uint8_t* buf, size_t len) override;
  Status write(SevenBitAddr address, const uint8_t* data, size_t len) override;
  Status writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                   uint8_t* rxData, size_t rxLen) override;
  Status transaction(SevenBitAddr address, const Operation* ops, size_t count) override;

  /// Typed register read through the server's register primitive
  template <typename V>
  Status readRegister(uint8_t reg, V& out) {
    return _bridge.readRegister(reg, out);
  }

  /// SMBus block read
  Status readBlock(uint8_t reg, uint8_t* buf, size_t len, size_t& count);

  /// True for the [WRITE(1 byte), READ(n)] transaction shape
  static bool isRegisterReadShape(const Operation* ops, size_t count);

private:
  Status _registerRead(uint8_t reg, uint8_t* buf, size_t len, const char* operation);

  DeviceBridge _bridge;
};

} // namespace I2cBridge
