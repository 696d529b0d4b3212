/// @file DeviceBridge.cpp
/// @brief Core adapter implementation

#include "I2cBridge/DeviceBridge.h"

#include <cstring>
#include <utility>

#include "I2cBridge/ProtocolTable.h"

namespace I2cBridge {

DeviceBridge::DeviceBridge(DeviceClient&& device) : _device(std::move(device)) {}

Status DeviceBridge::begin(const DeviceConfig& config) { return _device.begin(config); }

// ============================================================================
// 7-bit
// ============================================================================

Status DeviceBridge::read(SevenBitAddr /*address*/, uint8_t* buf, size_t len) {
  size_t received = 0;
  const ResponseCode rc = _device.readInto(buf, len, received);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "read");
  }
  return Status::Ok();
}

Status DeviceBridge::write(SevenBitAddr /*address*/, const uint8_t* data, size_t len) {
  const ResponseCode rc = _device.write(data, len);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "write");
  }
  return Status::Ok();
}

Status DeviceBridge::writeRead(SevenBitAddr /*address*/, const uint8_t* txData, size_t txLen,
                               uint8_t* rxData, size_t rxLen) {
  size_t received = 0;

  if (txLen == 1 && txData != nullptr && _device.supportsRegisterRead()) {
    const ResponseCode rc = _device.readRegInto(txData[0], rxData, rxLen, received);
    if (rc != ResponseCode::SUCCESS) {
      return Status::Error(rc, "write_read_reg");
    }
    return Status::Ok();
  }

  ResponseCode rc = _device.write(txData, txLen);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "write_read_write_phase");
  }
  rc = _device.readInto(rxData, rxLen, received);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "write_read_read_phase");
  }
  return Status::Ok();
}

Status DeviceBridge::transaction(SevenBitAddr address, const Operation* ops, size_t count) {
  if (count > 0 && ops == nullptr) {
    return Status::Error(ResponseCode::BAD_ARG, "transaction");
  }

  for (size_t i = 0; i < count; ++i) {
    const Operation& op = ops[i];
    if (op.type == OperationType::READ) {
      const Status st = read(address, op.readBuffer, op.len);
      if (!st.ok()) {
        return st.withOperation("transaction_read");
      }
    } else {
      const Status st = write(address, op.writeData, op.len);
      if (!st.ok()) {
        return st.withOperation("transaction_write");
      }
    }
  }
  return Status::Ok();
}

// ============================================================================
// 10-bit
// ============================================================================

void DeviceBridge::tenBitHeader(TenBitAddr address, uint8_t header[2]) {
  const uint16_t value = address.get();
  header[0] = static_cast<uint8_t>(
      proto::TEN_BIT_HEADER_PREFIX |
      ((value >> proto::TEN_BIT_HIGH_SHIFT) & proto::TEN_BIT_HIGH_MASK));
  header[1] = static_cast<uint8_t>(value & proto::TEN_BIT_LOW_MASK);
}

Status DeviceBridge::read(TenBitAddr address, uint8_t* buf, size_t len) {
  uint8_t header[proto::TEN_BIT_HEADER_LEN];
  tenBitHeader(address, header);

  ResponseCode rc = _device.write(header, sizeof(header));
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "10bit_address_setup");
  }

  size_t received = 0;
  rc = _device.readInto(buf, len, received);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "10bit_read");
  }
  return Status::Ok();
}

Status DeviceBridge::write(TenBitAddr address, const uint8_t* data, size_t len) {
  if (len > proto::TEN_BIT_MAX_PAYLOAD) {
    return Status::Error(ResponseCode::TOO_MUCH_DATA, "10bit_write_buffer_overflow",
                         static_cast<int32_t>(len));
  }
  if (len > 0 && data == nullptr) {
    return Status::Error(ResponseCode::BAD_ARG, "10bit_write");
  }

  uint8_t frame[proto::TEN_BIT_MAX_FRAME];
  tenBitHeader(address, frame);
  if (len > 0) {
    std::memcpy(frame + proto::TEN_BIT_HEADER_LEN, data, len);
  }

  const ResponseCode rc = _device.write(frame, proto::TEN_BIT_HEADER_LEN + len);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "10bit_write");
  }
  return Status::Ok();
}

Status DeviceBridge::writeRead(TenBitAddr address, const uint8_t* txData, size_t txLen,
                               uint8_t* rxData, size_t rxLen) {
  const Status st = write(address, txData, txLen);
  if (!st.ok()) {
    return st;
  }
  return read(address, rxData, rxLen);
}

Status DeviceBridge::transaction(TenBitAddr address, const Operation* ops, size_t count) {
  if (count > 0 && ops == nullptr) {
    return Status::Error(ResponseCode::BAD_ARG, "transaction");
  }

  for (size_t i = 0; i < count; ++i) {
    const Operation& op = ops[i];
    const Status st = (op.type == OperationType::READ)
                          ? read(address, op.readBuffer, op.len)
                          : write(address, op.writeData, op.len);
    if (!st.ok()) {
      return st;
    }
  }
  return Status::Ok();
}

// ============================================================================
// Register fast path
// ============================================================================

Status DeviceBridge::readBlock(uint8_t reg, uint8_t* buf, size_t len, size_t& count) {
  count = 0;
  const ResponseCode rc = _device.readBlock(reg, buf, len, count);
  if (rc != ResponseCode::SUCCESS) {
    return Status::Error(rc, "smbus_block_read");
  }
  return Status::Ok();
}

} // namespace I2cBridge
