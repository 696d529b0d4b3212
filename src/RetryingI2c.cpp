/// @file RetryingI2c.cpp
/// @brief Retry policy shared by all RetryingI2c instantiations

#include "I2cBridge/RetryingI2c.h"

#include "I2cBridge/ErrorClassifier.h"

namespace I2cBridge {

bool isRetryable(const Status& st) {
  if (st.ok()) {
    return false;
  }
  // The same request fails the same way
  if (st.isDeviceNotFound() || isCallerError(st.code)) {
    return false;
  }
  const ErrorKind kind = st.kind();
  return kind == ErrorKind::ARBITRATION_LOSS || kind == ErrorKind::OTHER;
}

uint32_t retryBackoffMs(const RetryConfig& config, uint16_t attempt, const Status& st) {
  uint32_t delay = config.backoffStepMs * (static_cast<uint32_t>(attempt) + 1U);
  if (config.honorSuggestedDelay) {
    const uint32_t suggested = st.retryDelayMs();
    if (suggested > delay) {
      delay = suggested;
    }
  }
  return delay;
}

void sleepBeforeRetry(const RetryConfig& config, uint16_t attempt, const Status& st) {
  if (config.delayMs == nullptr) {
    return;
  }
  const uint32_t delay = retryBackoffMs(config, attempt, st);
  if (delay > 0) {
    config.delayMs(delay, config.delayUser);
  }
}

} // namespace I2cBridge
