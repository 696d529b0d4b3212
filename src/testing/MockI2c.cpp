/// @file MockI2c.cpp
/// @brief Scripted I2C substitute implementation

#include "I2cBridge/testing/MockI2c.h"

#include <cstring>

namespace I2cBridge {
namespace testing {

namespace {

const char* opName(MockOp op) {
  switch (op) {
    case MockOp::READ: return "read";
    case MockOp::WRITE: return "write";
    case MockOp::WRITE_READ: return "write_read";
  }
  return "unknown";
}

bool bytesEqual(const uint8_t* a, size_t aLen, const uint8_t* b, size_t bLen) {
  if (aLen != bLen) {
    return false;
  }
  return aLen == 0 || std::memcmp(a, b, aLen) == 0;
}

} // namespace

// ============================================================================
// Scripting
// ============================================================================

Status MockI2c::expectRead(uint8_t address, const uint8_t* data, size_t len) {
  return _addExpectation(MockOp::READ, address, nullptr, 0, data, len, ResponseCode::SUCCESS);
}

Status MockI2c::expectWrite(uint8_t address, const uint8_t* data, size_t len) {
  return _addExpectation(MockOp::WRITE, address, data, len, nullptr, 0, ResponseCode::SUCCESS);
}

Status MockI2c::expectWriteRead(uint8_t address, const uint8_t* tx, size_t txLen,
                                const uint8_t* rx, size_t rxLen) {
  return _addExpectation(MockOp::WRITE_READ, address, tx, txLen, rx, rxLen,
                         ResponseCode::SUCCESS);
}

Status MockI2c::expectFailure(MockOp op, uint8_t address, ResponseCode code) {
  if (code == ResponseCode::SUCCESS) {
    return Status::Error(ResponseCode::BAD_ARG, "mock: injected failure must not be SUCCESS");
  }
  return _addExpectation(op, address, nullptr, 0, nullptr, 0, code);
}

Status MockI2c::_addExpectation(MockOp op, uint8_t address, const uint8_t* tx, size_t txLen,
                                const uint8_t* rx, size_t rxLen, ResponseCode result) {
  if (_count >= MAX_EXPECTATIONS) {
    return Status::Error(ResponseCode::BAD_ARG, "mock: script is full",
                         static_cast<int32_t>(MockFault::SCRIPT_FULL));
  }
  if (txLen > MAX_EXPECTED_BYTES || rxLen > MAX_EXPECTED_BYTES) {
    return Status::Error(ResponseCode::BAD_ARG, "mock: expectation data too long",
                         static_cast<int32_t>(MockFault::DATA_TOO_LONG));
  }
  if ((txLen > 0 && tx == nullptr) || (rxLen > 0 && rx == nullptr)) {
    return Status::Error(ResponseCode::BAD_ARG, "mock: null expectation data");
  }

  MockExpectation& exp = _script[_count];
  exp = MockExpectation{};
  exp.op = op;
  exp.address = address;
  exp.result = result;
  if (txLen > 0) {
    std::memcpy(exp.writeData, tx, txLen);
  }
  exp.writeLen = txLen;
  if (rxLen > 0) {
    std::memcpy(exp.readData, rx, rxLen);
  }
  exp.readLen = rxLen;
  _count++;
  return Status::Ok();
}

Status MockI2c::verifyComplete() const {
  if (_position != _count || _writePhasePending) {
    return Status::Error(ResponseCode::BAD_DEVICE_STATE, "mock: expectations not consumed",
                         static_cast<int32_t>(MockFault::INCOMPLETE));
  }
  return Status::Ok();
}

void MockI2c::clear() {
  _count = 0;
  _position = 0;
  _writePhasePending = false;
  _lastFault = MockFault::NONE;
  _deviceCalls = 0;
  _busCalls = 0;
}

// ============================================================================
// Matching
// ============================================================================

Status MockI2c::_fault(MockFault fault, const char* msg) {
  // A rejected call also drops a half-matched WRITE_READ; the expectation
  // must be replayed from its write phase.
  _writePhasePending = false;
  _lastFault = fault;
  return Status::Error(ResponseCode::BAD_RESPONSE, msg, static_cast<int32_t>(fault));
}

Status MockI2c::_advance(const MockExpectation& exp) {
  _position++;
  _writePhasePending = false;
  _lastFault = MockFault::NONE;
  if (exp.result != ResponseCode::SUCCESS) {
    return Status::Error(exp.result, opName(exp.op));
  }
  return Status::Ok();
}

Status MockI2c::_onWrite(uint8_t address, const uint8_t* data, size_t len) {
  if (_position >= _count) {
    return _fault(MockFault::UNEXPECTED_OPERATION, "mock: write with no expectation left");
  }
  const MockExpectation& exp = _script[_position];
  if (_writePhasePending) {
    return _fault(MockFault::WRONG_OPERATION, "mock: write while waiting for read phase");
  }
  if (exp.op == MockOp::READ) {
    return _fault(MockFault::WRONG_OPERATION, "mock: write where read was expected");
  }
  if (exp.address != address) {
    return _fault(MockFault::ADDRESS_MISMATCH, "mock: write to unexpected address");
  }
  if (exp.result != ResponseCode::SUCCESS) {
    return _advance(exp);
  }
  if (!bytesEqual(exp.writeData, exp.writeLen, data, len)) {
    return _fault(MockFault::DATA_MISMATCH, "mock: written bytes differ from expectation");
  }
  if (exp.op == MockOp::WRITE_READ) {
    _writePhasePending = true;
    _lastFault = MockFault::NONE;
    return Status::Ok();
  }
  return _advance(exp);
}

Status MockI2c::_onRead(uint8_t address, uint8_t* buf, size_t len, size_t& received,
                        bool allowShort) {
  received = 0;
  if (_position >= _count) {
    return _fault(MockFault::UNEXPECTED_OPERATION, "mock: read with no expectation left");
  }
  const MockExpectation& exp = _script[_position];
  const bool readPhase = _writePhasePending && exp.op == MockOp::WRITE_READ;
  if (exp.op != MockOp::READ && !readPhase) {
    return _fault(MockFault::WRONG_OPERATION, "mock: read where write was expected");
  }
  if (exp.address != address) {
    return _fault(MockFault::ADDRESS_MISMATCH, "mock: read from unexpected address");
  }
  if (exp.result != ResponseCode::SUCCESS) {
    return _advance(exp);
  }
  if (allowShort ? (len < exp.readLen) : (len != exp.readLen)) {
    return _fault(MockFault::LENGTH_MISMATCH, "mock: read length differs from expectation");
  }
  if (exp.readLen > 0) {
    std::memcpy(buf, exp.readData, exp.readLen);
  }
  received = exp.readLen;
  return _advance(exp);
}

Status MockI2c::_onWriteRead(uint8_t address, const uint8_t* tx, size_t txLen, uint8_t* rx,
                             size_t rxLen, size_t& received, bool allowShort) {
  received = 0;
  if (_position >= _count) {
    return _fault(MockFault::UNEXPECTED_OPERATION, "mock: write_read with no expectation left");
  }
  const MockExpectation& exp = _script[_position];
  if (_writePhasePending) {
    return _fault(MockFault::WRONG_OPERATION, "mock: write_read while waiting for read phase");
  }
  if (exp.op == MockOp::WRITE) {
    return _onWriteThenRead(address, tx, txLen, rx, rxLen, received, allowShort);
  }
  if (exp.op != MockOp::WRITE_READ) {
    return _fault(MockFault::WRONG_OPERATION, "mock: write_read where another op was expected");
  }
  if (exp.address != address) {
    return _fault(MockFault::ADDRESS_MISMATCH, "mock: write_read to unexpected address");
  }
  if (exp.result != ResponseCode::SUCCESS) {
    return _advance(exp);
  }
  if (!bytesEqual(exp.writeData, exp.writeLen, tx, txLen)) {
    return _fault(MockFault::DATA_MISMATCH, "mock: written bytes differ from expectation");
  }
  if (allowShort ? (rxLen < exp.readLen) : (rxLen != exp.readLen)) {
    return _fault(MockFault::LENGTH_MISMATCH, "mock: read length differs from expectation");
  }
  if (exp.readLen > 0) {
    std::memcpy(rx, exp.readData, exp.readLen);
  }
  received = exp.readLen;
  return _advance(exp);
}

Status MockI2c::_onWriteThenRead(uint8_t address, const uint8_t* tx, size_t txLen, uint8_t* rx,
                                 size_t rxLen, size_t& received, bool allowShort) {
  const MockExpectation& wr = _script[_position];
  if (wr.address != address) {
    return _fault(MockFault::ADDRESS_MISMATCH, "mock: write_read to unexpected address");
  }
  if (wr.result != ResponseCode::SUCCESS) {
    return _advance(wr);
  }
  if (!bytesEqual(wr.writeData, wr.writeLen, tx, txLen)) {
    return _fault(MockFault::DATA_MISMATCH, "mock: written bytes differ from expectation");
  }
  if (_position + 1 >= _count) {
    return _fault(MockFault::UNEXPECTED_OPERATION, "mock: write_read with no read left");
  }

  // Both entries are consumed together or not at all
  const MockExpectation& rd = _script[_position + 1];
  if (rd.op != MockOp::READ) {
    return _fault(MockFault::WRONG_OPERATION, "mock: write_read where read was not scripted");
  }
  if (rd.address != address) {
    return _fault(MockFault::ADDRESS_MISMATCH, "mock: read from unexpected address");
  }
  if (rd.result == ResponseCode::SUCCESS) {
    if (allowShort ? (rxLen < rd.readLen) : (rxLen != rd.readLen)) {
      return _fault(MockFault::LENGTH_MISMATCH, "mock: read length differs from expectation");
    }
    if (rd.readLen > 0) {
      std::memcpy(rx, rd.readData, rd.readLen);
    }
    received = rd.readLen;
  }
  _position++;
  return _advance(rd);
}

// ============================================================================
// I2cBus
// ============================================================================

Status MockI2c::read(SevenBitAddr address, uint8_t* buf, size_t len) {
  _busCalls++;
  size_t received = 0;
  return _onRead(address.get(), buf, len, received, false);
}

Status MockI2c::write(SevenBitAddr address, const uint8_t* data, size_t len) {
  _busCalls++;
  return _onWrite(address.get(), data, len);
}

Status MockI2c::writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                          uint8_t* rxData, size_t rxLen) {
  _busCalls++;
  size_t received = 0;
  return _onWriteRead(address.get(), txData, txLen, rxData, rxLen, received, false);
}

Status MockI2c::transaction(SevenBitAddr address, const Operation* ops, size_t count) {
  _busCalls++;
  if (count > 0 && ops == nullptr) {
    return Status::Error(ResponseCode::BAD_ARG, "mock: null operation list");
  }
  for (size_t i = 0; i < count; ++i) {
    const Operation& op = ops[i];
    size_t received = 0;
    const Status st = (op.type == OperationType::READ)
                          ? _onRead(address.get(), op.readBuffer, op.len, received, false)
                          : _onWrite(address.get(), op.writeData, op.len);
    if (!st.ok()) {
      return st;
    }
  }
  return Status::Ok();
}

// ============================================================================
// Device transport
// ============================================================================

DeviceConfig MockI2c::deviceConfig(const DeviceTarget& target, uint32_t timeoutMs) {
  DeviceConfig cfg;
  cfg.target = target;
  cfg.write = _deviceWrite;
  cfg.readInto = _deviceRead;
  cfg.readRegInto = _deviceReadReg;
  cfg.readBlock = _deviceReadBlock;
  cfg.user = this;
  cfg.timeoutMs = timeoutMs;
  return cfg;
}

ResponseCode MockI2c::_deviceWrite(const DeviceTarget& target, const uint8_t* data, size_t len,
                                   uint32_t /*timeoutMs*/, void* user) {
  MockI2c* self = static_cast<MockI2c*>(user);
  self->_deviceCalls++;
  return self->_onWrite(target.address, data, len).code;
}

ResponseCode MockI2c::_deviceRead(const DeviceTarget& target, uint8_t* buf, size_t len,
                                  size_t& received, uint32_t /*timeoutMs*/, void* user) {
  MockI2c* self = static_cast<MockI2c*>(user);
  self->_deviceCalls++;
  return self->_onRead(target.address, buf, len, received, false).code;
}

ResponseCode MockI2c::_deviceReadReg(const DeviceTarget& target, const uint8_t* reg,
                                     size_t regLen, uint8_t* buf, size_t len, size_t& received,
                                     uint32_t /*timeoutMs*/, void* user) {
  MockI2c* self = static_cast<MockI2c*>(user);
  self->_deviceCalls++;
  return self->_onWriteRead(target.address, reg, regLen, buf, len, received, false).code;
}

ResponseCode MockI2c::_deviceReadBlock(const DeviceTarget& target, const uint8_t* reg,
                                       size_t regLen, uint8_t* buf, size_t len,
                                       size_t& received, uint32_t /*timeoutMs*/, void* user) {
  MockI2c* self = static_cast<MockI2c*>(user);
  self->_deviceCalls++;
  return self->_onWriteRead(target.address, reg, regLen, buf, len, received, true).code;
}

} // namespace testing
} // namespace I2cBridge
