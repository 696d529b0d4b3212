/// @file DeviceBridge.h
/// @brief Core adapter: generic I2C operations over a fixed-target device client
#pragma once

#include <cstddef>
#include <cstdint>

#include "I2cBridge/Address.h"
#include "I2cBridge/Config.h"
#include "I2cBridge/DeviceClient.h"
#include "I2cBridge/I2cBus.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

/// Core adapter between the generic I2C interface and a DeviceClient.
///
/// Addressing model:
/// - 7-bit operations IGNORE the per-call address. The device client is bound
///   to one target at begin() and that binding is authoritative; passing a
///   different SevenBitAddr does not retarget anything.
/// - 10-bit operations USE the per-call address. The client cannot bind a
///   10-bit target, so the adapter writes the two-byte 10-bit header itself.
///
/// Limitations:
/// - writeRead() with a multi-byte write and transaction() are issued as
///   separate round trips with no repeated START in between. Another bus user
///   can interleave.
/// - 10-bit reads send the header as a write and then read, without the
///   repeated START and read header of a compliant 10-bit read.
///
/// Each call makes at most two device-client calls. Errors are never
/// swallowed; every failure is tagged with the step that produced it.
class DeviceBridge : public I2cBus, public TenBitI2cBus {
public:
  DeviceBridge() = default;

  /// Take ownership of an already-bound device client
  explicit DeviceBridge(DeviceClient&& device);

  /// Bind the owned device client
  Status begin(const DeviceConfig& config);

  /// Owned device client, for server-specific operations
  DeviceClient& device() { return _device; }
  const DeviceClient& device() const { return _device; }

  // =========================================================================
  // 7-bit (address ignored)
  // =========================================================================

  /// Single read; callers must size buf to the exact expected length
  Status read(SevenBitAddr address, uint8_t* buf, size_t len) override;

  Status write(SevenBitAddr address, const uint8_t* data, size_t len) override;

  /// txLen == 1 uses the register-read primitive (one round trip) when the
  /// transport has one; anything else is a write followed by a read
  Status writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                   uint8_t* rxData, size_t rxLen) override;

  /// Best-effort sequential execution, no repeated START between steps
  Status transaction(SevenBitAddr address, const Operation* ops, size_t count) override;

  // =========================================================================
  // 10-bit (address used to build the header)
  // =========================================================================

  Status read(TenBitAddr address, uint8_t* buf, size_t len) override;

  /// Header and payload go out as one write of at most 258 bytes
  Status write(TenBitAddr address, const uint8_t* data, size_t len) override;

  Status writeRead(TenBitAddr address, const uint8_t* txData, size_t txLen,
                   uint8_t* rxData, size_t rxLen) override;

  Status transaction(TenBitAddr address, const Operation* ops, size_t count) override;

  // =========================================================================
  // Register fast path (not part of the generic interface)
  // =========================================================================

  /// Typed register read through the server's register primitive
  template <typename V, typename R>
  Status readRegister(const R& reg, V& out) {
    const ResponseCode rc = _device.readReg(reg, out);
    if (rc != ResponseCode::SUCCESS) {
      return Status::Error(rc, "optimized_register_read");
    }
    return Status::Ok();
  }

  /// SMBus block read
  /// @param count Receives the number of bytes the device returned
  Status readBlock(uint8_t reg, uint8_t* buf, size_t len, size_t& count);

  /// Build the two-byte 10-bit address header (11110XX0, low byte)
  static void tenBitHeader(TenBitAddr address, uint8_t header[2]);

private:
  DeviceClient _device;
};

} // namespace I2cBridge
