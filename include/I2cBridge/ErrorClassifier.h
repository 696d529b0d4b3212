/// @file ErrorClassifier.h
/// @brief Mapping from device-client response codes to semantic error kinds
#pragma once

#include <cstddef>
#include <cstdint>

#include "I2cBridge/ResponseCode.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

/// Map a response code to its semantic kind.
/// Total: every code maps to exactly one kind. SUCCESS maps to OTHER; seeing
/// it here means the caller classified a non-error.
ErrorKind classify(ResponseCode code);

/// Address NACK (early or late) or NO_DEVICE: the target is absent
bool isDeviceNotFound(ResponseCode code);

/// BUS_LOCKED, BUS_TIMEOUT or ARBITRATION_LOST: the bus is transiently unusable
bool isTemporary(ResponseCode code);

/// TOO_MUCH_DATA, BAD_ARG, BAD_DEVICE_STATE or OPERATION_NOT_SUPPORTED: the
/// request was rejected before the bus was touched
bool isCallerError(ResponseCode code);

/// Suggested base delay before retrying
/// @return delay in milliseconds, 0 when there is no suggestion
uint32_t suggestedRetryDelayMs(ResponseCode code);

/// Upper-case name of a response code ("BUS_LOCKED")
const char* toString(ResponseCode code);

/// Upper-case name of an error kind ("NACK_ADDRESS")
const char* toString(ErrorKind kind);

/// Render a status as "I2C <tag> operation failed: <CODE> (<n>)"
/// @param st  Status to render
/// @param buf Output buffer (always NUL-terminated when len > 0)
/// @param len Size of buf in bytes
/// @return Number of characters that would have been written (snprintf semantics)
size_t formatStatus(const Status& st, char* buf, size_t len);

} // namespace I2cBridge
