/// @file DeviceClient.h
/// @brief Fixed-target device handle forwarding to the server transport
#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "I2cBridge/Config.h"
#include "I2cBridge/ResponseCode.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

/// Handle to one device endpoint on the I2C server.
///
/// Bound at begin() to exactly one (controller, port, mux/segment, address)
/// tuple. Every operation targets that device; there is no per-call address.
/// Move-only: one handle per endpoint.
class DeviceClient {
public:
  DeviceClient() = default;
  DeviceClient(const DeviceClient&) = delete;
  DeviceClient& operator=(const DeviceClient&) = delete;
  DeviceClient(DeviceClient&& other);
  DeviceClient& operator=(DeviceClient&& other);

  /// Bind the handle
  /// @param config Target and transport callbacks
  /// @return Status::Ok() on success; BAD_CONTROLLER, BAD_MUX, BAD_SEGMENT,
  ///         RESERVED_ADDRESS, BAD_ARG or OPERATION_NOT_SUPPORTED otherwise
  Status begin(const DeviceConfig& config);

  /// Release the binding
  void end();

  bool isBound() const { return _bound; }
  const DeviceTarget& target() const { return _config.target; }
  const DeviceConfig& config() const { return _config; }

  /// @return true if the transport provides the one-round-trip register read
  bool supportsRegisterRead() const { return _config.readRegInto != nullptr; }

  /// Write bytes to the device
  ResponseCode write(const uint8_t* data, size_t len);

  /// Read into buf
  /// @param received Receives the number of bytes read
  ResponseCode readInto(uint8_t* buf, size_t len, size_t& received);

  /// Select a register and read it back in one round trip
  ResponseCode readRegInto(const uint8_t* reg, size_t regLen, uint8_t* buf, size_t len,
                           size_t& received);

  ResponseCode readRegInto(uint8_t reg, uint8_t* buf, size_t len, size_t& received) {
    return readRegInto(&reg, 1, buf, len, received);
  }

  /// SMBus block read: byte count is decided by the device
  ResponseCode readBlock(const uint8_t* reg, size_t regLen, uint8_t* buf, size_t len,
                         size_t& received);

  ResponseCode readBlock(uint8_t reg, uint8_t* buf, size_t len, size_t& received) {
    return readBlock(&reg, 1, buf, len, received);
  }

  /// Typed register read: sends the bytes of reg, reads exactly sizeof(V)
  /// @return BAD_RESPONSE if the device returned a different length
  template <typename V, typename R>
  ResponseCode readReg(const R& reg, V& out) {
    static_assert(std::is_trivially_copyable<R>::value, "register type must be trivially copyable");
    static_assert(std::is_trivially_copyable<V>::value, "value type must be trivially copyable");

    uint8_t regBytes[sizeof(R)];
    std::memcpy(regBytes, &reg, sizeof(R));
    uint8_t raw[sizeof(V)] = {};
    size_t received = 0;
    const ResponseCode rc = readRegInto(regBytes, sizeof(R), raw, sizeof(V), received);
    if (rc != ResponseCode::SUCCESS) {
      return rc;
    }
    if (received != sizeof(V)) {
      return ResponseCode::BAD_RESPONSE;
    }
    std::memcpy(&out, raw, sizeof(V));
    return ResponseCode::SUCCESS;
  }

private:
  DeviceConfig _config;
  bool _bound = false;
};

} // namespace I2cBridge
