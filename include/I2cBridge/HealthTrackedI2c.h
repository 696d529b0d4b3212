/// @file HealthTrackedI2c.h
/// @brief Driver health tracking for any I2cBus
#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "I2cBridge/Config.h"
#include "I2cBridge/I2cBus.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

/// Driver state for health monitoring
enum class DriverState : uint8_t {
  UNINIT,    ///< begin() not called
  READY,     ///< Operational, consecutiveFailures == 0
  DEGRADED,  ///< 1 <= consecutiveFailures < offlineThreshold
  OFFLINE    ///< consecutiveFailures >= offlineThreshold
};

/// Counts outcomes and derives a DriverState from consecutive failures.
/// Counters saturate instead of wrapping.
class HealthMonitor {
public:
  /// Start tracking (state becomes READY, counters cleared)
  void begin(const HealthConfig& config);

  /// Record one operation outcome. Caller errors (isCallerError) are not
  /// counted.
  /// @return st, unchanged
  Status record(const Status& st);

  /// Clear counters; READY if begun, UNINIT otherwise
  void reset();

  DriverState state() const { return _state; }

  /// @return true if READY or DEGRADED
  bool isOnline() const {
    return _state == DriverState::READY || _state == DriverState::DEGRADED;
  }

  uint32_t lastOkMs() const { return _lastOkMs; }
  uint32_t lastErrorMs() const { return _lastErrorMs; }
  Status lastError() const { return _lastError; }
  uint8_t consecutiveFailures() const { return _consecutiveFailures; }
  uint32_t totalFailures() const { return _totalFailures; }
  uint32_t totalSuccess() const { return _totalSuccess; }
  uint8_t offlineThreshold() const { return _config.offlineThreshold; }

private:
  uint32_t _now() const;

  HealthConfig _config;
  bool _initialized = false;
  DriverState _state = DriverState::UNINIT;
  uint32_t _lastOkMs = 0;
  uint32_t _lastErrorMs = 0;
  Status _lastError = Status::Ok();
  uint8_t _consecutiveFailures = 0;
  uint32_t _totalFailures = 0;
  uint32_t _totalSuccess = 0;
};

/// Forwards every operation to the wrapped bus and records its outcome.
/// Results are returned unchanged.
///
/// @tparam Inner Any I2cBus implementation; owned by value, or borrowed when
///         Inner is a reference.
template <typename Inner>
class HealthTrackedI2c : public I2cBus {
  static_assert(std::is_base_of<I2cBus, typename std::remove_reference<Inner>::type>::value,
                "Inner must implement I2cBus");

public:
  HealthTrackedI2c(Inner&& inner, const HealthConfig& config)
      : _inner(std::forward<Inner>(inner)) {
    _health.begin(config);
  }

  Inner& inner() { return _inner; }
  const Inner& inner() const { return _inner; }
  const HealthMonitor& health() const { return _health; }

  DriverState state() const { return _health.state(); }
  bool isOnline() const { return _health.isOnline(); }
  void resetHealth() { _health.reset(); }

  Status read(SevenBitAddr address, uint8_t* buf, size_t len) override {
    return _health.record(_inner.read(address, buf, len));
  }

  Status write(SevenBitAddr address, const uint8_t* data, size_t len) override {
    return _health.record(_inner.write(address, data, len));
  }

  Status writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                   uint8_t* rxData, size_t rxLen) override {
    return _health.record(_inner.writeRead(address, txData, txLen, rxData, rxLen));
  }

  Status transaction(SevenBitAddr address, const Operation* ops, size_t count) override {
    return _health.record(_inner.transaction(address, ops, count));
  }

private:
  Inner _inner;
  HealthMonitor _health;
};

} // namespace I2cBridge
