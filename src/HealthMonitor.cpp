/// @file HealthMonitor.cpp
/// @brief Driver health state machine

#include "I2cBridge/HealthTrackedI2c.h"

#include "I2cBridge/ErrorClassifier.h"

#include <limits>

namespace I2cBridge {

void HealthMonitor::begin(const HealthConfig& config) {
  _config = config;
  if (_config.offlineThreshold == 0) {
    _config.offlineThreshold = 1;
  }
  _initialized = true;
  reset();
}

void HealthMonitor::reset() {
  _lastOkMs = 0;
  _lastErrorMs = 0;
  _lastError = Status::Ok();
  _consecutiveFailures = 0;
  _totalFailures = 0;
  _totalSuccess = 0;
  _state = _initialized ? DriverState::READY : DriverState::UNINIT;
}

Status HealthMonitor::record(const Status& st) {
  // Rejected requests say nothing about the device
  if (!st.ok() && isCallerError(st.code)) {
    return st;
  }

  const uint32_t now = _now();
  const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
  const uint8_t maxU8 = std::numeric_limits<uint8_t>::max();

  if (!_initialized) {
    if (st.ok()) {
      _lastOkMs = now;
    } else {
      _lastError = st;
      _lastErrorMs = now;
    }
    return st;
  }

  if (st.ok()) {
    _lastOkMs = now;
    if (_totalSuccess < maxU32) {
      _totalSuccess++;
    }
    _consecutiveFailures = 0;
    _state = DriverState::READY;
    return st;
  }

  _lastError = st;
  _lastErrorMs = now;
  if (_totalFailures < maxU32) {
    _totalFailures++;
  }
  if (_consecutiveFailures < maxU8) {
    _consecutiveFailures++;
  }

  if (_consecutiveFailures >= _config.offlineThreshold) {
    _state = DriverState::OFFLINE;
  } else {
    _state = DriverState::DEGRADED;
  }

  return st;
}

uint32_t HealthMonitor::_now() const {
  if (_config.nowMs == nullptr) {
    return 0;
  }
  return _config.nowMs(_config.clockUser);
}

} // namespace I2cBridge
