/// @file ProtocolTable.h
/// @brief Address ranges, 10-bit framing constants and timing defaults
#pragma once

#include <cstddef>
#include <cstdint>

namespace I2cBridge {
namespace proto {

// ============================================================================
// 7-bit addressing
// ============================================================================

static constexpr uint8_t SEVEN_BIT_MAX = 0x7F;

// 0x00-0x07 and 0x78-0x7F are reserved by the I2C bus standard
static constexpr uint8_t SEVEN_BIT_FIRST_USABLE = 0x08;
static constexpr uint8_t SEVEN_BIT_LAST_USABLE = 0x77;

// ============================================================================
// 10-bit addressing
// ============================================================================

static constexpr uint16_t TEN_BIT_MAX = 0x3FF;

// First header byte: 1111 0XX0, XX = address bits 9:8
static constexpr uint8_t TEN_BIT_HEADER_PREFIX = 0xF0;
static constexpr uint8_t TEN_BIT_HIGH_SHIFT = 7;
static constexpr uint8_t TEN_BIT_HIGH_MASK = 0x06;
static constexpr uint16_t TEN_BIT_LOW_MASK = 0xFF;

static constexpr size_t TEN_BIT_HEADER_LEN = 2;
static constexpr size_t TEN_BIT_MAX_PAYLOAD = 256;
static constexpr size_t TEN_BIT_MAX_FRAME = TEN_BIT_HEADER_LEN + TEN_BIT_MAX_PAYLOAD;

// ============================================================================
// Server topology limits
// ============================================================================

static constexpr uint8_t CONTROLLER_COUNT = 8;
static constexpr uint8_t PORTS_PER_CONTROLLER = 8;
static constexpr uint8_t MUX_COUNT = 4;
static constexpr uint8_t SEGMENT_COUNT = 8;

// ============================================================================
// Timing (milliseconds)
// ============================================================================

static constexpr uint32_t DEFAULT_TIMEOUT_MS = 50;
static constexpr uint32_t DEFAULT_BACKOFF_STEP_MS = 10;

// Suggested base delays per response code
static constexpr uint32_t BUS_LOCKED_RETRY_MS = 10;
static constexpr uint32_t BUS_TIMEOUT_RETRY_MS = 100;
static constexpr uint32_t ARBITRATION_LOST_RETRY_MS = 1;

} // namespace proto
} // namespace I2cBridge
