/// @file Config.h
/// @brief Configuration structures for the device client and decorators
#pragma once

#include <cstddef>
#include <cstdint>

#include "I2cBridge/ProtocolTable.h"
#include "I2cBridge/ResponseCode.h"

namespace I2cBridge {

/// Handle of the I2C server task that owns the controllers
using TaskId = uint16_t;

/// Port configuration index on a controller
using PortIndex = uint8_t;

/// Hardware I2C controller
enum class Controller : uint8_t {
  I2C0 = 0,
  I2C1 = 1,
  I2C2 = 2,
  I2C3 = 3,
  I2C4 = 4,
  I2C5 = 5,
  I2C6 = 6,
  I2C7 = 7
};

/// Multiplexer on a port
enum class Mux : uint8_t {
  M1 = 1,
  M2 = 2,
  M3 = 3,
  M4 = 4
};

/// Segment (downstream channel) of a multiplexer
enum class Segment : uint8_t {
  S1 = 1,
  S2 = 2,
  S3 = 3,
  S4 = 4,
  S5 = 5,
  S6 = 6,
  S7 = 7,
  S8 = 8
};

/// Everything the server needs to reach one device
struct DeviceTarget {
  TaskId serverTask = 0;                   ///< I2C server task
  Controller controller = Controller::I2C0; ///< Hardware controller
  PortIndex port = 0;                      ///< Port on the controller
  bool hasSegment = false;                 ///< true if behind a mux segment
  Mux mux = Mux::M1;                       ///< Mux (valid if hasSegment)
  Segment segment = Segment::S1;           ///< Segment (valid if hasSegment)
  uint8_t address = 0;                     ///< 7-bit target address

  /// Target on a port without multiplexer
  static constexpr DeviceTarget simple(TaskId task, Controller controller, PortIndex port,
                                       uint8_t address) {
    return DeviceTarget{task, controller, port, false, Mux::M1, Segment::S1, address};
  }

  /// Target behind a mux segment
  static constexpr DeviceTarget withSegment(TaskId task, Controller controller, PortIndex port,
                                            Mux mux, Segment segment, uint8_t address) {
    return DeviceTarget{task, controller, port, true, mux, segment, address};
  }
};

/// Device write callback signature
/// @param target    Device the handle is bound to
/// @param data      Bytes to write
/// @param len       Number of bytes to write
/// @param timeoutMs Maximum time to wait for completion
/// @param user      User context pointer passed through from DeviceConfig
/// @return SUCCESS or the server's response code
using DeviceWriteFn = ResponseCode (*)(const DeviceTarget& target, const uint8_t* data,
                                       size_t len, uint32_t timeoutMs, void* user);

/// Device read callback signature
/// @param target    Device the handle is bound to
/// @param buf       Buffer for read data
/// @param len       Number of bytes requested
/// @param received  Receives the number of bytes actually read
/// @param timeoutMs Maximum time to wait for completion
/// @param user      User context pointer passed through from DeviceConfig
/// @return SUCCESS or the server's response code
using DeviceReadFn = ResponseCode (*)(const DeviceTarget& target, uint8_t* buf, size_t len,
                                      size_t& received, uint32_t timeoutMs, void* user);

/// Register read callback signature (register read and SMBus block read)
/// @param target    Device the handle is bound to
/// @param reg       Register selector bytes
/// @param regLen    Number of register selector bytes
/// @param buf       Buffer for read data
/// @param len       Size of buf
/// @param received  Receives the number of bytes actually read
/// @param timeoutMs Maximum time to wait for completion
/// @param user      User context pointer passed through from DeviceConfig
/// @return SUCCESS or the server's response code
/// @note The server performs the register select and the read in one
///       round trip with a repeated START.
using DeviceReadRegFn = ResponseCode (*)(const DeviceTarget& target, const uint8_t* reg,
                                         size_t regLen, uint8_t* buf, size_t len,
                                         size_t& received, uint32_t timeoutMs, void* user);

/// Configuration for a device client handle
struct DeviceConfig {
  // === Target (required) ===
  DeviceTarget target;

  // === Transport (write/readInto required) ===
  DeviceWriteFn write = nullptr;          ///< Plain write
  DeviceReadFn readInto = nullptr;        ///< Plain read
  DeviceReadRegFn readRegInto = nullptr;  ///< Optional register read
  DeviceReadRegFn readBlock = nullptr;    ///< Optional SMBus block read
  void* user = nullptr;                   ///< User context for callbacks

  uint32_t timeoutMs = proto::DEFAULT_TIMEOUT_MS; ///< Per-operation timeout
};

/// Blocking sleep callback
/// @param delayMs Duration to sleep
/// @param user    User context pointer passed through from RetryConfig
using DelayFn = void (*)(uint32_t delayMs, void* user);

/// Configuration for the retry decorator
struct RetryConfig {
  uint8_t maxRetries = 3;                                ///< Retries after the first attempt (0 = single attempt)
  uint32_t backoffStepMs = proto::DEFAULT_BACKOFF_STEP_MS; ///< Linear step: step * (attempt + 1)
  bool honorSuggestedDelay = true;                       ///< Use the code's suggested delay as a floor
  DelayFn delayMs = nullptr;                             ///< Sleep primitive (nullptr = retry immediately)
  void* delayUser = nullptr;                             ///< User context for delayMs
};

/// Monotonic millisecond clock callback
using NowMsFn = uint32_t (*)(void* user);

/// Configuration for the health tracking decorator
struct HealthConfig {
  uint8_t offlineThreshold = 5;  ///< Consecutive failures before OFFLINE
  NowMsFn nowMs = nullptr;       ///< Clock for lastOkMs/lastErrorMs (nullptr = timestamps stay 0)
  void* clockUser = nullptr;     ///< User context for nowMs
};

} // namespace I2cBridge
