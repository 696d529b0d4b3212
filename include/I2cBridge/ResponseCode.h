/// @file ResponseCode.h
/// @brief Status codes reported by the I2C server through the device client
#pragma once

#include <cstdint>

namespace I2cBridge {

/// Response codes returned by the device client for every operation.
/// Values are stable; they travel over IPC as a single byte.
enum class ResponseCode : uint8_t {
  SUCCESS = 0,              ///< Operation completed
  BAD_RESPONSE,             ///< Malformed reply from the server
  BAD_ARG,                  ///< Bad argument sent to the server
  NO_DEVICE,                ///< Indicated device does not exist
  BAD_CONTROLLER,           ///< Bad controller
  RESERVED_ADDRESS,         ///< Device address is reserved
  BAD_PORT,                 ///< Indicated port is invalid
  BAD_DEFAULT_PORT,         ///< Default port for controller is invalid
  NO_REGISTER,              ///< Device does not have indicated register
  BAD_MUX,                  ///< Indicated mux is an invalid mux identifier
  BAD_SEGMENT,              ///< Indicated segment is invalid
  MUX_NOT_FOUND,            ///< Indicated mux does not exist
  SEGMENT_NOT_FOUND,        ///< Indicated segment does not exist
  SEGMENT_DISCONNECTED,     ///< Segment disconnected during operation
  MUX_DISCONNECTED,         ///< Mux disconnected during operation
  MUX_MISSING,              ///< No device at address used for mux in-band management
  BAD_MUX_REGISTER,         ///< Register used for mux in-band management is invalid
  BUS_RESET,                ///< Bus was reset during operation
  BUS_RESET_MUX,            ///< Bus was reset during mux in-band management
  BUS_LOCKED,               ///< Bus was locked
  BUS_LOCKED_MUX,           ///< Bus locked during mux in-band management
  CONTROLLER_BUSY,          ///< Controller appeared to be busy
  BUS_ERROR,                ///< Invalid bus condition (START/STOP misplacement)
  BAD_DEVICE_STATE,         ///< Device handle is not in a usable state
  OPERATION_NOT_SUPPORTED,  ///< Requested operation is not supported
  ILLEGAL_LEASE_COUNT,      ///< Illegal number of leases
  TOO_MUCH_DATA,            ///< Too much data; exceeds a fixed buffer
  ADDRESS_NACK_SENT_EARLY,  ///< Address NACK before any data moved
  ADDRESS_NACK_SENT_LATE,   ///< Address NACK after a repeated START
  DATA_NACK_SENT,           ///< Target NACKed a data byte
  ARBITRATION_LOST,         ///< Another controller won arbitration
  BUS_TIMEOUT               ///< Bus operation exceeded the controller timeout
};

/// Number of defined response codes (for exhaustive iteration in tests/tools)
static constexpr uint8_t RESPONSE_CODE_COUNT =
    static_cast<uint8_t>(ResponseCode::BUS_TIMEOUT) + 1;

} // namespace I2cBridge
