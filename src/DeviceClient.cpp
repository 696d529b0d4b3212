/// @file DeviceClient.cpp
/// @brief Device handle validation and transport forwarding

#include "I2cBridge/DeviceClient.h"

#include "I2cBridge/ProtocolTable.h"

namespace I2cBridge {

DeviceClient::DeviceClient(DeviceClient&& other) : _config(other._config), _bound(other._bound) {
  other._bound = false;
}

DeviceClient& DeviceClient::operator=(DeviceClient&& other) {
  if (this != &other) {
    _config = other._config;
    _bound = other._bound;
    other._bound = false;
  }
  return *this;
}

Status DeviceClient::begin(const DeviceConfig& config) {
  _bound = false;

  if (config.write == nullptr || config.readInto == nullptr) {
    return Status::Error(ResponseCode::OPERATION_NOT_SUPPORTED, "Transport callbacks not set");
  }
  if (config.timeoutMs == 0) {
    return Status::Error(ResponseCode::BAD_ARG, "Timeout must be > 0");
  }

  const DeviceTarget& t = config.target;
  if (static_cast<uint8_t>(t.controller) >= proto::CONTROLLER_COUNT) {
    return Status::Error(ResponseCode::BAD_CONTROLLER, "Invalid controller",
                         static_cast<int32_t>(t.controller));
  }
  if (t.port >= proto::PORTS_PER_CONTROLLER) {
    return Status::Error(ResponseCode::BAD_PORT, "Invalid port", t.port);
  }
  if (t.hasSegment) {
    const uint8_t mux = static_cast<uint8_t>(t.mux);
    const uint8_t segment = static_cast<uint8_t>(t.segment);
    if (mux < 1 || mux > proto::MUX_COUNT) {
      return Status::Error(ResponseCode::BAD_MUX, "Invalid mux", mux);
    }
    if (segment < 1 || segment > proto::SEGMENT_COUNT) {
      return Status::Error(ResponseCode::BAD_SEGMENT, "Invalid segment", segment);
    }
  }
  if (t.address > proto::SEVEN_BIT_MAX) {
    return Status::Error(ResponseCode::RESERVED_ADDRESS, "Invalid device address", t.address);
  }

  _config = config;
  _bound = true;
  return Status::Ok();
}

void DeviceClient::end() { _bound = false; }

ResponseCode DeviceClient::write(const uint8_t* data, size_t len) {
  if (!_bound) {
    return ResponseCode::BAD_DEVICE_STATE;
  }
  if (len > 0 && data == nullptr) {
    return ResponseCode::BAD_ARG;
  }
  return _config.write(_config.target, data, len, _config.timeoutMs, _config.user);
}

ResponseCode DeviceClient::readInto(uint8_t* buf, size_t len, size_t& received) {
  received = 0;
  if (!_bound) {
    return ResponseCode::BAD_DEVICE_STATE;
  }
  if (len > 0 && buf == nullptr) {
    return ResponseCode::BAD_ARG;
  }
  const ResponseCode rc =
      _config.readInto(_config.target, buf, len, received, _config.timeoutMs, _config.user);
  if (rc == ResponseCode::SUCCESS && received > len) {
    received = 0;
    return ResponseCode::BAD_RESPONSE;
  }
  return rc;
}

ResponseCode DeviceClient::readRegInto(const uint8_t* reg, size_t regLen, uint8_t* buf,
                                       size_t len, size_t& received) {
  received = 0;
  if (!_bound) {
    return ResponseCode::BAD_DEVICE_STATE;
  }
  if (_config.readRegInto == nullptr) {
    return ResponseCode::OPERATION_NOT_SUPPORTED;
  }
  if ((regLen > 0 && reg == nullptr) || (len > 0 && buf == nullptr)) {
    return ResponseCode::BAD_ARG;
  }
  const ResponseCode rc = _config.readRegInto(_config.target, reg, regLen, buf, len, received,
                                              _config.timeoutMs, _config.user);
  if (rc == ResponseCode::SUCCESS && received > len) {
    received = 0;
    return ResponseCode::BAD_RESPONSE;
  }
  return rc;
}

ResponseCode DeviceClient::readBlock(const uint8_t* reg, size_t regLen, uint8_t* buf,
                                     size_t len, size_t& received) {
  received = 0;
  if (!_bound) {
    return ResponseCode::BAD_DEVICE_STATE;
  }
  if (_config.readBlock == nullptr) {
    return ResponseCode::OPERATION_NOT_SUPPORTED;
  }
  if ((regLen > 0 && reg == nullptr) || (len > 0 && buf == nullptr)) {
    return ResponseCode::BAD_ARG;
  }
  const ResponseCode rc = _config.readBlock(_config.target, reg, regLen, buf, len, received,
                                            _config.timeoutMs, _config.user);
  if (rc == ResponseCode::SUCCESS && received > len) {
    received = 0;
    return ResponseCode::BAD_RESPONSE;
  }
  return rc;
}

} // namespace I2cBridge
