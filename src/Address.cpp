/// @file Address.cpp
/// @brief Address validation

#include "I2cBridge/Address.h"

#include <cstdio>

#include "I2cBridge/ProtocolTable.h"

namespace I2cBridge {

AddressStatus SevenBitAddr::tryNew(uint8_t value, SevenBitAddr& out) {
  if (value > proto::SEVEN_BIT_MAX) {
    return AddressStatus::Error(AddrErr::SEVEN_BIT_RANGE, value,
                                "Address exceeds 7-bit range");
  }
  if (value < proto::SEVEN_BIT_FIRST_USABLE || value > proto::SEVEN_BIT_LAST_USABLE) {
    return AddressStatus::Error(AddrErr::RESERVED, value, "Address is reserved");
  }
  out = SevenBitAddr(value);
  return AddressStatus::Ok(value);
}

AddressStatus TenBitAddr::tryNew(uint16_t value, TenBitAddr& out) {
  if (value > proto::TEN_BIT_MAX) {
    return AddressStatus::Error(AddrErr::TEN_BIT_RANGE, value,
                                "Address exceeds 10-bit range");
  }
  out = TenBitAddr(value);
  return AddressStatus::Ok(value);
}

size_t formatAddressStatus(const AddressStatus& st, char* buf, size_t len) {
  int n = 0;
  switch (st.code) {
    case AddrErr::OK:
      n = std::snprintf(buf, len, "Address 0x%02X OK", static_cast<unsigned>(st.value));
      break;
    case AddrErr::SEVEN_BIT_RANGE:
      n = std::snprintf(buf, len, "Address 0x%02X exceeds 7-bit range (0x00-0x7F)",
                        static_cast<unsigned>(st.value));
      break;
    case AddrErr::TEN_BIT_RANGE:
      n = std::snprintf(buf, len, "Address 0x%03X exceeds 10-bit range (0x000-0x3FF)",
                        static_cast<unsigned>(st.value));
      break;
    case AddrErr::RESERVED:
      n = std::snprintf(buf, len, "Address 0x%02X is reserved", static_cast<unsigned>(st.value));
      break;
  }
  return n < 0 ? 0 : static_cast<size_t>(n);
}

} // namespace I2cBridge
