/// @file Address.h
/// @brief Validated 7-bit and 10-bit I2C address types
#pragma once

#include <cstddef>
#include <cstdint>

namespace I2cBridge {

/// Address validation error codes
enum class AddrErr : uint8_t {
  OK = 0,           ///< Address accepted
  SEVEN_BIT_RANGE,  ///< Value above 0x7F
  TEN_BIT_RANGE,    ///< Value above 0x3FF
  RESERVED          ///< 7-bit value in 0x00-0x07 or 0x78-0x7F
};

/// Result of address validation, carries the offending value
struct AddressStatus {
  AddrErr code = AddrErr::OK;
  uint16_t value = 0;       ///< Value that was validated
  const char* msg = "";     ///< Static string describing the error

  constexpr AddressStatus() = default;
  constexpr AddressStatus(AddrErr c, uint16_t v, const char* m) : code(c), value(v), msg(m) {}

  /// @return true if the address was accepted
  constexpr bool ok() const { return code == AddrErr::OK; }

  static constexpr AddressStatus Ok(uint16_t v) { return AddressStatus{AddrErr::OK, v, "OK"}; }

  static constexpr AddressStatus Error(AddrErr err, uint16_t v, const char* message) {
    return AddressStatus{err, v, message};
  }
};

/// 7-bit I2C address
class SevenBitAddr {
public:
  constexpr SevenBitAddr() = default;

  /// Unchecked construction (any 8-bit value, for pre-validated inputs)
  constexpr explicit SevenBitAddr(uint8_t value) : _value(value) {}

  /// Validating construction: accepts 0x08-0x77 only
  /// @param value Raw address
  /// @param out   Receives the address on success, untouched on failure
  static AddressStatus tryNew(uint8_t value, SevenBitAddr& out);

  constexpr uint8_t get() const { return _value; }
  constexpr explicit operator uint8_t() const { return _value; }

  constexpr bool operator==(SevenBitAddr other) const { return _value == other._value; }
  constexpr bool operator!=(SevenBitAddr other) const { return _value != other._value; }

private:
  uint8_t _value = 0;
};

/// 10-bit I2C address
class TenBitAddr {
public:
  constexpr TenBitAddr() = default;

  /// Unchecked construction (any 16-bit value)
  constexpr explicit TenBitAddr(uint16_t value) : _value(value) {}

  /// Validating construction: accepts 0x000-0x3FF
  /// @param value Raw address
  /// @param out   Receives the address on success, untouched on failure
  static AddressStatus tryNew(uint16_t value, TenBitAddr& out);

  constexpr uint16_t get() const { return _value; }
  constexpr explicit operator uint16_t() const { return _value; }

  constexpr bool operator==(TenBitAddr other) const { return _value == other._value; }
  constexpr bool operator!=(TenBitAddr other) const { return _value != other._value; }

private:
  uint16_t _value = 0;
};

/// Render an address status for diagnostics
/// ("Address 0x80 exceeds 7-bit range (0x00-0x7F)")
/// @return Number of characters that would have been written (snprintf semantics)
size_t formatAddressStatus(const AddressStatus& st, char* buf, size_t len);

} // namespace I2cBridge
