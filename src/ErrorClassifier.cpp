/// @file ErrorClassifier.cpp
/// @brief Response code classification and status rendering

#include "I2cBridge/ErrorClassifier.h"

#include <cstdio>

#include "I2cBridge/ProtocolTable.h"

namespace I2cBridge {

ErrorKind classify(ResponseCode code) {
  switch (code) {
    case ResponseCode::ADDRESS_NACK_SENT_EARLY:
    case ResponseCode::ADDRESS_NACK_SENT_LATE:
      return ErrorKind::NACK_ADDRESS;
    case ResponseCode::DATA_NACK_SENT:
      return ErrorKind::NACK_DATA;
    case ResponseCode::BUS_ERROR:
      return ErrorKind::BUS;
    case ResponseCode::ARBITRATION_LOST:
      return ErrorKind::ARBITRATION_LOSS;
    default:
      return ErrorKind::OTHER;
  }
}

bool isDeviceNotFound(ResponseCode code) {
  return code == ResponseCode::ADDRESS_NACK_SENT_EARLY ||
         code == ResponseCode::ADDRESS_NACK_SENT_LATE ||
         code == ResponseCode::NO_DEVICE;
}

bool isTemporary(ResponseCode code) {
  return code == ResponseCode::BUS_LOCKED ||
         code == ResponseCode::BUS_TIMEOUT ||
         code == ResponseCode::ARBITRATION_LOST;
}

bool isCallerError(ResponseCode code) {
  switch (code) {
    case ResponseCode::TOO_MUCH_DATA:
    case ResponseCode::BAD_ARG:
    case ResponseCode::BAD_DEVICE_STATE:
    case ResponseCode::OPERATION_NOT_SUPPORTED:
      return true;
    default:
      return false;
  }
}

uint32_t suggestedRetryDelayMs(ResponseCode code) {
  switch (code) {
    case ResponseCode::BUS_LOCKED:
      return proto::BUS_LOCKED_RETRY_MS;
    case ResponseCode::BUS_TIMEOUT:
      return proto::BUS_TIMEOUT_RETRY_MS;
    case ResponseCode::ARBITRATION_LOST:
      return proto::ARBITRATION_LOST_RETRY_MS;
    default:
      return 0;
  }
}

const char* toString(ResponseCode code) {
  switch (code) {
    case ResponseCode::SUCCESS: return "SUCCESS";
    case ResponseCode::BAD_RESPONSE: return "BAD_RESPONSE";
    case ResponseCode::BAD_ARG: return "BAD_ARG";
    case ResponseCode::NO_DEVICE: return "NO_DEVICE";
    case ResponseCode::BAD_CONTROLLER: return "BAD_CONTROLLER";
    case ResponseCode::RESERVED_ADDRESS: return "RESERVED_ADDRESS";
    case ResponseCode::BAD_PORT: return "BAD_PORT";
    case ResponseCode::BAD_DEFAULT_PORT: return "BAD_DEFAULT_PORT";
    case ResponseCode::NO_REGISTER: return "NO_REGISTER";
    case ResponseCode::BAD_MUX: return "BAD_MUX";
    case ResponseCode::BAD_SEGMENT: return "BAD_SEGMENT";
    case ResponseCode::MUX_NOT_FOUND: return "MUX_NOT_FOUND";
    case ResponseCode::SEGMENT_NOT_FOUND: return "SEGMENT_NOT_FOUND";
    case ResponseCode::SEGMENT_DISCONNECTED: return "SEGMENT_DISCONNECTED";
    case ResponseCode::MUX_DISCONNECTED: return "MUX_DISCONNECTED";
    case ResponseCode::MUX_MISSING: return "MUX_MISSING";
    case ResponseCode::BAD_MUX_REGISTER: return "BAD_MUX_REGISTER";
    case ResponseCode::BUS_RESET: return "BUS_RESET";
    case ResponseCode::BUS_RESET_MUX: return "BUS_RESET_MUX";
    case ResponseCode::BUS_LOCKED: return "BUS_LOCKED";
    case ResponseCode::BUS_LOCKED_MUX: return "BUS_LOCKED_MUX";
    case ResponseCode::CONTROLLER_BUSY: return "CONTROLLER_BUSY";
    case ResponseCode::BUS_ERROR: return "BUS_ERROR";
    case ResponseCode::BAD_DEVICE_STATE: return "BAD_DEVICE_STATE";
    case ResponseCode::OPERATION_NOT_SUPPORTED: return "OPERATION_NOT_SUPPORTED";
    case ResponseCode::ILLEGAL_LEASE_COUNT: return "ILLEGAL_LEASE_COUNT";
    case ResponseCode::TOO_MUCH_DATA: return "TOO_MUCH_DATA";
    case ResponseCode::ADDRESS_NACK_SENT_EARLY: return "ADDRESS_NACK_SENT_EARLY";
    case ResponseCode::ADDRESS_NACK_SENT_LATE: return "ADDRESS_NACK_SENT_LATE";
    case ResponseCode::DATA_NACK_SENT: return "DATA_NACK_SENT";
    case ResponseCode::ARBITRATION_LOST: return "ARBITRATION_LOST";
    case ResponseCode::BUS_TIMEOUT: return "BUS_TIMEOUT";
  }
  return "UNKNOWN";
}

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NACK_ADDRESS: return "NACK_ADDRESS";
    case ErrorKind::NACK_DATA: return "NACK_DATA";
    case ErrorKind::BUS: return "BUS";
    case ErrorKind::ARBITRATION_LOSS: return "ARBITRATION_LOSS";
    case ErrorKind::OTHER: return "OTHER";
  }
  return "UNKNOWN";
}

size_t formatStatus(const Status& st, char* buf, size_t len) {
  const char* tag = (st.msg != nullptr && st.msg[0] != '\0') ? st.msg : "unknown";
  const int n = std::snprintf(buf, len, "I2C %s operation failed: %s (%u)", tag,
                              toString(st.code), static_cast<unsigned>(st.code));
  return n < 0 ? 0 : static_cast<size_t>(n);
}

// ============================================================================
// Status classification
// ============================================================================

ErrorKind Status::kind() const { return classify(code); }

bool Status::isDeviceNotFound() const { return I2cBridge::isDeviceNotFound(code); }

bool Status::isTemporary() const { return I2cBridge::isTemporary(code); }

uint32_t Status::retryDelayMs() const { return suggestedRetryDelayMs(code); }

} // namespace I2cBridge
