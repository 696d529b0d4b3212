/// @file MockI2c.h
/// @brief Scripted I2C substitute for driver tests
#pragma once

#include <cstddef>
#include <cstdint>

#include "I2cBridge/Config.h"
#include "I2cBridge/I2cBus.h"
#include "I2cBridge/ResponseCode.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {
namespace testing {

/// Kind of a scripted operation
enum class MockOp : uint8_t {
  READ = 0,
  WRITE,
  WRITE_READ
};

/// Why the last call was rejected (stored in Status::detail)
enum class MockFault : int32_t {
  NONE = 0,
  UNEXPECTED_OPERATION,  ///< Script exhausted
  WRONG_OPERATION,       ///< Kind differs from the next expectation
  ADDRESS_MISMATCH,      ///< Address differs from the next expectation
  DATA_MISMATCH,         ///< Written bytes differ from the next expectation
  LENGTH_MISMATCH,       ///< Read length differs from the scripted response
  SCRIPT_FULL,           ///< More than MAX_EXPECTATIONS scripted
  DATA_TOO_LONG,         ///< More than MAX_EXPECTED_BYTES in one expectation
  INCOMPLETE             ///< verifyComplete() with expectations left
};

/// One scripted operation
struct MockExpectation {
  static constexpr size_t MAX_BYTES = 256;

  MockOp op = MockOp::WRITE;
  uint8_t address = 0;
  ResponseCode result = ResponseCode::SUCCESS;  ///< Injected failure if not SUCCESS
  uint8_t writeData[MAX_BYTES] = {};
  size_t writeLen = 0;
  uint8_t readData[MAX_BYTES] = {};
  size_t readLen = 0;
};

/// Fixed-capacity queue of expected operations, consumed in order.
///
/// Usable two ways:
/// - directly as an I2cBus, to test drivers written against the generic
///   interface;
/// - as the transport of a DeviceClient (deviceConfig()), to test the adapter
///   layers on top of it.
///
/// A call that matches the next expectation returns the scripted data and
/// advances. A call that does not match returns BAD_RESPONSE with the
/// MockFault in Status::detail and does not advance.
///
/// A WRITE_READ expectation can also be satisfied by a matching write followed
/// by a matching read, and a one-round-trip register read can consume a WRITE
/// expectation together with the READ after it. One script therefore covers
/// both the register path and the two-step path. A rejected call during a
/// half-matched WRITE_READ rolls the write phase back.
class MockI2c : public I2cBus {
public:
  static constexpr size_t MAX_EXPECTATIONS = 32;
  static constexpr size_t MAX_EXPECTED_BYTES = MockExpectation::MAX_BYTES;

  MockI2c() = default;
  MockI2c(const MockI2c&) = delete;
  MockI2c& operator=(const MockI2c&) = delete;

  // =========================================================================
  // Scripting
  // =========================================================================

  /// Expect a read from address; respond with data
  Status expectRead(uint8_t address, const uint8_t* data, size_t len);

  /// Expect a write of exactly data to address
  Status expectWrite(uint8_t address, const uint8_t* data, size_t len);

  /// Expect a write of tx followed by a read answered with rx
  Status expectWriteRead(uint8_t address, const uint8_t* tx, size_t txLen,
                         const uint8_t* rx, size_t rxLen);

  /// Expect an operation of kind op to address and fail it with code.
  /// Data is not compared.
  Status expectFailure(MockOp op, uint8_t address, ResponseCode code);

  /// @return Ok if every expectation was consumed; BAD_DEVICE_STATE with
  ///         detail INCOMPLETE otherwise
  Status verifyComplete() const;

  /// Drop the script and reset counters
  void clear();

  size_t position() const { return _position; }
  size_t expectedCount() const { return _count; }
  size_t remaining() const { return _count - _position; }
  MockFault lastFault() const { return _lastFault; }

  /// Number of device-transport callback invocations (round trips)
  uint32_t deviceCallCount() const { return _deviceCalls; }

  /// Number of generic-interface calls
  uint32_t busCallCount() const { return _busCalls; }

  // =========================================================================
  // I2cBus
  // =========================================================================

  Status read(SevenBitAddr address, uint8_t* buf, size_t len) override;
  Status write(SevenBitAddr address, const uint8_t* data, size_t len) override;
  Status writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                   uint8_t* rxData, size_t rxLen) override;
  Status transaction(SevenBitAddr address, const Operation* ops, size_t count) override;

  // =========================================================================
  // Device transport
  // =========================================================================

  /// DeviceConfig whose callbacks are served by this mock.
  /// write -> WRITE, readInto -> READ, readRegInto -> WRITE_READ (or WRITE
  /// then READ), readBlock -> same as readRegInto with a response that may be
  /// shorter than the buffer.
  DeviceConfig deviceConfig(const DeviceTarget& target,
                            uint32_t timeoutMs = proto::DEFAULT_TIMEOUT_MS);

private:
  Status _addExpectation(MockOp op, uint8_t address, const uint8_t* tx, size_t txLen,
                         const uint8_t* rx, size_t rxLen, ResponseCode result);

  Status _onWrite(uint8_t address, const uint8_t* data, size_t len);
  Status _onRead(uint8_t address, uint8_t* buf, size_t len, size_t& received,
                 bool allowShort);
  Status _onWriteRead(uint8_t address, const uint8_t* tx, size_t txLen, uint8_t* rx,
                      size_t rxLen, size_t& received, bool allowShort);
  Status _onWriteThenRead(uint8_t address, const uint8_t* tx, size_t txLen, uint8_t* rx,
                          size_t rxLen, size_t& received, bool allowShort);

  Status _fault(MockFault fault, const char* msg);
  Status _advance(const MockExpectation& exp);

  static ResponseCode _deviceWrite(const DeviceTarget& target, const uint8_t* data, size_t len,
                                   uint32_t timeoutMs, void* user);
  static ResponseCode _deviceRead(const DeviceTarget& target, uint8_t* buf, size_t len,
                                  size_t& received, uint32_t timeoutMs, void* user);
  static ResponseCode _deviceReadReg(const DeviceTarget& target, const uint8_t* reg,
                                     size_t regLen, uint8_t* buf, size_t len,
                                     size_t& received, uint32_t timeoutMs, void* user);
  static ResponseCode _deviceReadBlock(const DeviceTarget& target, const uint8_t* reg,
                                       size_t regLen, uint8_t* buf, size_t len,
                                       size_t& received, uint32_t timeoutMs, void* user);

  MockExpectation _script[MAX_EXPECTATIONS];
  size_t _count = 0;
  size_t _position = 0;
  bool _writePhasePending = false;
  MockFault _lastFault = MockFault::NONE;
  uint32_t _deviceCalls = 0;
  uint32_t _busCalls = 0;
};

} // namespace testing
} // namespace I2cBridge
