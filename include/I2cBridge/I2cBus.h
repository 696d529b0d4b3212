/// @file I2cBus.h
/// @brief Generic per-operation-addressed I2C interface used by portable drivers
#pragma once

#include <cstddef>
#include <cstdint>

#include "I2cBridge/Address.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

/// Kind of one step in a transaction
enum class OperationType : uint8_t {
  READ = 0,
  WRITE = 1
};

/// One step of a transaction: read into a buffer or write from one
struct Operation {
  OperationType type = OperationType::WRITE;
  const uint8_t* writeData = nullptr;  ///< Source for WRITE
  uint8_t* readBuffer = nullptr;       ///< Destination for READ
  size_t len = 0;                      ///< Bytes to move

  static constexpr Operation Read(uint8_t* buf, size_t len) {
    return Operation{OperationType::READ, nullptr, buf, len};
  }

  static constexpr Operation Write(const uint8_t* data, size_t len) {
    return Operation{OperationType::WRITE, data, nullptr, len};
  }
};

/// Generic I2C operations with 7-bit addressing.
///
/// Every layer (core adapter, fast path, retry, health, mock) implements this
/// interface identically, so decorators compose in any order.
class I2cBus {
public:
  virtual ~I2cBus() = default;

  /// Read exactly len bytes from the device
  virtual Status read(SevenBitAddr address, uint8_t* buf, size_t len) = 0;

  /// Write len bytes to the device
  virtual Status write(SevenBitAddr address, const uint8_t* data, size_t len) = 0;

  /// Write txLen bytes then read rxLen bytes
  virtual Status writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                           uint8_t* rxData, size_t rxLen) = 0;

  /// Execute count operations in order, stopping at the first failure
  virtual Status transaction(SevenBitAddr address, const Operation* ops, size_t count) = 0;
};

/// Generic I2C operations with 10-bit addressing
class TenBitI2cBus {
public:
  virtual ~TenBitI2cBus() = default;

  virtual Status read(TenBitAddr address, uint8_t* buf, size_t len) = 0;
  virtual Status write(TenBitAddr address, const uint8_t* data, size_t len) = 0;
  virtual Status writeRead(TenBitAddr address, const uint8_t* txData, size_t txLen,
                           uint8_t* rxData, size_t rxLen) = 0;
  virtual Status transaction(TenBitAddr address, const Operation* ops, size_t count) = 0;
};

} // namespace I2cBridge
