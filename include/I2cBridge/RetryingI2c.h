/// @file RetryingI2c.h
/// @brief Retry decorator with linear backoff for any I2cBus
#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "I2cBridge/Config.h"
#include "I2cBridge/I2cBus.h"
#include "I2cBridge/Status.h"

namespace I2cBridge {

// ============================================================================
// Retry policy
// ============================================================================

/// Whether a failed attempt may be repeated.
/// Retryable: ARBITRATION_LOSS and OTHER kinds, except a missing device
/// (NO_DEVICE, address NACK) and errors raised before the bus is touched
/// (TOO_MUCH_DATA, BAD_ARG, BAD_DEVICE_STATE, OPERATION_NOT_SUPPORTED).
/// Address NACK, data NACK and bus errors are never retried.
bool isRetryable(const Status& st);

/// Delay before the retry that follows zero-based attempt `attempt`:
/// backoffStepMs * (attempt + 1), raised to the code's suggested delay when
/// honorSuggestedDelay is set.
uint32_t retryBackoffMs(const RetryConfig& config, uint16_t attempt, const Status& st);

/// Sleep through config.delayMs (no-op if unset)
void sleepBeforeRetry(const RetryConfig& config, uint16_t attempt, const Status& st);

// ============================================================================
// Decorator
// ============================================================================

/// Re-executes failed operations on the wrapped bus.
///
/// Makes at most maxRetries + 1 attempts. Returns immediately on success or on
/// a non-retryable error. When attempts run out the error of the last attempt
/// is returned; earlier errors are discarded. Backoff blocks the caller.
///
/// @tparam Inner Any I2cBus implementation; owned by value, or borrowed when
///         Inner is a reference (e.g. RetryingI2c<MockI2c&>).
template <typename Inner>
class RetryingI2c : public I2cBus {
  static_assert(std::is_base_of<I2cBus, typename std::remove_reference<Inner>::type>::value,
                "Inner must implement I2cBus");

public:
  RetryingI2c(Inner&& inner, const RetryConfig& config)
      : _inner(std::forward<Inner>(inner)), _config(config) {}

  Inner& inner() { return _inner; }
  const Inner& inner() const { return _inner; }
  const RetryConfig& config() const { return _config; }

  Status read(SevenBitAddr address, uint8_t* buf, size_t len) override {
    return _retry([&]() { return _inner.read(address, buf, len); });
  }

  Status write(SevenBitAddr address, const uint8_t* data, size_t len) override {
    return _retry([&]() { return _inner.write(address, data, len); });
  }

  Status writeRead(SevenBitAddr address, const uint8_t* txData, size_t txLen,
                   uint8_t* rxData, size_t rxLen) override {
    return _retry([&]() { return _inner.writeRead(address, txData, txLen, rxData, rxLen); });
  }

  Status transaction(SevenBitAddr address, const Operation* ops, size_t count) override {
    return _retry([&]() { return _inner.transaction(address, ops, count); });
  }

private:
  template <typename Fn>
  Status _retry(Fn&& operation) {
    Status last = Status::Ok();
    for (uint16_t attempt = 0; attempt <= _config.maxRetries; ++attempt) {
      last = operation();
      if (last.ok()) {
        return last;
      }
      if (!isRetryable(last) || attempt >= _config.maxRetries) {
        return last;
      }
      sleepBeforeRetry(_config, attempt, last);
    }
    return last;
  }

  Inner _inner;
  RetryConfig _config;
};

} // namespace I2cBridge
