/// @file I2cBridge.h
/// @brief Umbrella header for the I2C adaptation and resilience layer
#pragma once

#include "I2cBridge/Version.h"
#include "I2cBridge/ResponseCode.h"
#include "I2cBridge/Status.h"
#include "I2cBridge/ErrorClassifier.h"
#include "I2cBridge/Address.h"
#include "I2cBridge/Config.h"
#include "I2cBridge/DeviceClient.h"
#include "I2cBridge/I2cBus.h"
#include "I2cBridge/DeviceBridge.h"
#include "I2cBridge/RegisterOptimizedI2c.h"
#include "I2cBridge/RetryingI2c.h"
#include "I2cBridge/HealthTrackedI2c.h"
