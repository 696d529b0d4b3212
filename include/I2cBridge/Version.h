/// @file Version.h
/// @brief Library version information
#pragma once

namespace I2cBridge {

/// Library version string
static constexpr const char* VERSION = "0.3.0";

/// Version components
static constexpr int VERSION_MAJOR = 0;
static constexpr int VERSION_MINOR = 3;
static constexpr int VERSION_PATCH = 0;

/// Version as single integer (major * 10000 + minor * 100 + patch)
static constexpr int VERSION_INT = 300;

} // namespace I2cBridge
