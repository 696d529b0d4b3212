/// @file Status.h
/// @brief Error codes and status handling for I2cBridge
#pragma once

#include <cstdint>
#include <cstring>

#include "I2cBridge/ResponseCode.h"

namespace I2cBridge {

/// Semantic error kind exposed to portable drivers
enum class ErrorKind : uint8_t {
  NACK_ADDRESS = 0,  ///< Target did not acknowledge its address
  NACK_DATA,         ///< Target did not acknowledge a data byte
  BUS,               ///< Bus error (misplaced START/STOP)
  ARBITRATION_LOSS,  ///< Lost arbitration to another controller
  OTHER              ///< Anything not covered above
};

/// Status structure returned by all fallible operations
///
/// `msg` is a static tag naming the internal step that produced the error
/// ("read", "write_read_reg", "10bit_address_setup", ...). Classification
/// (kind(), isDeviceNotFound(), isTemporary(), retryDelayMs()) depends on
/// `code` only.
struct Status {
  ResponseCode code = ResponseCode::SUCCESS;
  int32_t detail = 0;        ///< Implementation-specific detail (e.g., offending length)
  const char* msg = "";      ///< Static operation tag

  constexpr Status() = default;
  constexpr Status(ResponseCode c, int32_t d, const char* m) : code(c), detail(d), msg(m) {}

  /// @return true if operation succeeded
  constexpr bool ok() const { return code == ResponseCode::SUCCESS; }

  /// Create a success status
  static constexpr Status Ok() { return Status{ResponseCode::SUCCESS, 0, "OK"}; }

  /// Create an error status
  static constexpr Status Error(ResponseCode err, const char* operation, int32_t detailCode = 0) {
    return Status{err, detailCode, operation};
  }

  /// Same error, re-tagged with a different operation
  constexpr Status withOperation(const char* operation) const {
    return Status{code, detail, operation};
  }

  /// Semantic kind of this error (OTHER for SUCCESS)
  ErrorKind kind() const;

  /// True if the target is absent from the bus (terminal for this address)
  bool isDeviceNotFound() const;

  /// True if the bus is transiently unusable
  bool isTemporary() const;

  /// Suggested base delay before retrying, 0 if none
  uint32_t retryDelayMs() const;
};

inline bool operator==(const Status& a, const Status& b) {
  if (a.code != b.code || a.detail != b.detail) {
    return false;
  }
  if (a.msg == b.msg) {
    return true;
  }
  if (a.msg == nullptr || b.msg == nullptr) {
    return false;
  }
  return std::strcmp(a.msg, b.msg) == 0;
}

inline bool operator!=(const Status& a, const Status& b) { return !(a == b); }

} // namespace I2cBridge
