/// @file RegisterOptimizedI2c.cpp
/// @brief Fast-path dispatcher implementation

#include "I2cBridge/RegisterOptimizedI2c.h"

#include <utility>

namespace I2cBridge {

RegisterOptimizedI2c::RegisterOptimizedI2c(DeviceBridge&& bridge) : _bridge(std::move(bridge)) {}

Status RegisterOptimizedI2c::read(SevenBitAddr address, uint8_t* buf, size_t len) {
  return _bridge.read(address, buf, len);
}

Status RegisterOptimizedI2c::write(SevenBitAddr address, const uint8_t* data, size_t len) {
  return _bridge.write(address, data, len);
}

Status RegisterOptimizedI2c::writeRead(SevenBitAddr address, const uint8_t* txData,
                                       size_t txLen, uint8_t* rxData, size_t rxLen) {
  if (txLen == 1 && txData != nullptr && _bridge.device().supportsRegisterRead()) {
    return _registerRead(txData[0], rxData, rxLen, "optimized_write_read");
  }
  return _bridge.writeRead(address, txData, txLen, rxData, rxLen);
}

Status RegisterOptimizedI2c::transaction(SevenBitAddr address, const Operation* ops,
                                         size_t count) {
  if (isRegisterReadShape(ops, count) && _bridge.device().supportsRegisterRead()) {
    return _registerRead(ops[0].writeData[0], ops[1].readBuffer, ops[1].len,
                         "optimized_transaction");
  }
  return _bridge.transaction(address, ops, count);
}

Status RegisterOptimizedI2c::readBlock(uint8_t reg, uint8_t* buf, size_t len, size_t& count) {
  const Status st = _bridge.readBlock(reg, buf, len, count);
  if (!st.ok()) {
    return st.withOperation("optimized_block_read");
  }
  return st;
}

bool RegisterOptimizedI2c::isRegisterReadShape(const Operation* ops, size_t count) {
  if (ops == nullptr || count != 2) {
    return false;
  }
  return ops[0].type == OperationType::WRITE && ops[0].len == 1 && ops[0].writeData != nullptr &&
         ops[1].type == OperationType::READ;
}

Status RegisterOptimizedI2c::_registerRead(uint8_t reg, uint8_t* buf, size_t len,
                                           const char* operation) {
  size_t received = 0;
  const ResponseCode rc = _bridge.device().readRegInto(reg, buf, len, received);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, operation);
  }
  return Status::Ok();
}

} // namespace I2cBridge
