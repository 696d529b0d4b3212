/// @file main.cpp
/// @brief Bring-up CLI for the I2C bridge stack
/// @note This is an EXAMPLE, not part of the library

#include <Arduino.h>
#include <cstdlib>
#include "common/Log.h"
#include "common/BoardConfig.h"
#include "common/I2cTransport.h"
#include "common/I2cScanner.h"

#include "I2cBridge/I2cBridge.h"

using I2cBridge::DriverState;
using I2cBridge::HealthConfig;
using I2cBridge::HealthTrackedI2c;
using I2cBridge::Operation;
using I2cBridge::RegisterOptimizedI2c;
using I2cBridge::RetryConfig;
using I2cBridge::RetryingI2c;
using I2cBridge::SevenBitAddr;
using I2cBridge::Status;
using I2cBridge::TenBitAddr;

// ============================================================================
// Globals
// ============================================================================

using RetryStack = RetryingI2c<RegisterOptimizedI2c>;
using BusStack = HealthTrackedI2c<RetryStack>;

static constexpr size_t MAX_BYTES = 32;

RetryConfig makeRetryConfig() {
  RetryConfig cfg;
  cfg.maxRetries = 3;
  cfg.delayMs = transport::arduinoDelay;
  return cfg;
}

HealthConfig makeHealthConfig() {
  HealthConfig cfg;
  cfg.offlineThreshold = 5;
  cfg.nowMs = transport::arduinoMillis;
  return cfg;
}

BusStack gBus(RetryStack(RegisterOptimizedI2c(), makeRetryConfig()), makeHealthConfig());
I2cBridge::DeviceTarget gTarget = board::defaultTarget();
bool verboseMode = false;

RegisterOptimizedI2c& fastPath() { return gBus.inner().inner(); }

// ============================================================================
// Helper Functions
// ============================================================================

const char* stateToStr(DriverState st) {
  switch (st) {
    case DriverState::UNINIT: return "UNINIT";
    case DriverState::READY: return "READY";
    case DriverState::DEGRADED: return "DEGRADED";
    case DriverState::OFFLINE: return "OFFLINE";
    default: return "UNKNOWN";
  }
}

void printStatus(const Status& st) {
  char line[96];
  if (st.ok()) {
    Serial.println("  Status: OK");
    return;
  }
  I2cBridge::formatStatus(st, line, sizeof(line));
  Serial.printf("  %s\n", line);
  Serial.printf("  Kind: %s%s%s\n", I2cBridge::toString(st.kind()),
                st.isDeviceNotFound() ? " (device not found)" : "",
                st.isTemporary() ? " (temporary)" : "");
  if (st.detail != 0) {
    Serial.printf("  Detail: %ld\n", static_cast<long>(st.detail));
  }
}

void printBytes(const uint8_t* data, size_t len) {
  Serial.print("  Data:");
  for (size_t i = 0; i < len; i++) {
    Serial.printf(" %02X", data[i]);
  }
  Serial.println();
}

void printDriverHealth() {
  const I2cBridge::HealthMonitor& h = gBus.health();
  Serial.println("=== Bus Health ===");
  Serial.printf("  State: %s\n", stateToStr(h.state()));
  Serial.printf("  Online: %s\n", h.isOnline() ? "YES" : "NO");
  Serial.printf("  Consecutive failures: %u\n", h.consecutiveFailures());
  Serial.printf("  Total failures: %lu\n", static_cast<unsigned long>(h.totalFailures()));
  Serial.printf("  Total success: %lu\n", static_cast<unsigned long>(h.totalSuccess()));
  Serial.printf("  Last OK at: %lu ms\n", static_cast<unsigned long>(h.lastOkMs()));
  Serial.printf("  Last error at: %lu ms\n", static_cast<unsigned long>(h.lastErrorMs()));
  if (!h.lastError().ok()) {
    printStatus(h.lastError());
  }
}

void printRetryConfig() {
  const RetryConfig& cfg = gBus.inner().config();
  Serial.println("=== Retry ===");
  Serial.printf("  Max retries: %u\n", cfg.maxRetries);
  Serial.printf("  Backoff step: %lu ms\n", static_cast<unsigned long>(cfg.backoffStepMs));
  Serial.printf("  Honor suggested delay: %s\n", cfg.honorSuggestedDelay ? "YES" : "NO");
}

void printTarget() {
  Serial.printf("  Target: controller=%u port=%u addr=0x%02X\n",
                static_cast<unsigned>(gTarget.controller),
                static_cast<unsigned>(gTarget.port), gTarget.address);
}

bool parseU32(const String& token, uint32_t& out) {
  const char* str = token.c_str();
  char* end = nullptr;
  unsigned long value = std::strtoul(str, &end, 0);
  if (end == str || *end != '\0') {
    return false;
  }
  out = static_cast<uint32_t>(value);
  return true;
}

bool parseByte(const String& token, uint8_t& out) {
  uint32_t value = 0;
  if (!parseU32(token, value) || value > 0xFF) {
    return false;
  }
  out = static_cast<uint8_t>(value);
  return true;
}

/// Split on spaces into at most maxTokens tokens
size_t tokenize(const String& line, String* tokens, size_t maxTokens) {
  size_t count = 0;
  int start = 0;
  const int len = line.length();
  while (start < len && count < maxTokens) {
    while (start < len && line[start] == ' ') {
      start++;
    }
    if (start >= len) {
      break;
    }
    int end = line.indexOf(' ', start);
    if (end < 0) {
      end = len;
    }
    tokens[count++] = line.substring(start, end);
    start = end + 1;
  }
  return count;
}

/// Parse tokens[first..count) as bytes
bool parseBytes(const String* tokens, size_t first, size_t count, uint8_t* out, size_t& len) {
  len = 0;
  for (size_t i = first; i < count; i++) {
    if (len >= MAX_BYTES || !parseByte(tokens[i], out[len])) {
      return false;
    }
    len++;
  }
  return true;
}

Status bindDevice() {
  const Status st = fastPath().begin(transport::wireDeviceConfig(gTarget, board::I2C_TIMEOUT_MS));
  gBus.resetHealth();
  return st;
}

void printHelp() {
  Serial.println("=== Commands ===");
  Serial.println("  help                      - Show this help");
  Serial.println("  scan                      - Scan I2C bus");
  Serial.println("  addr <0x08-0x77>          - Rebind the device handle to a new address");
  Serial.println("  probe                     - Read 1 byte on the core adapter (no retry/health)");
  Serial.println("  read <n>                  - Read n bytes");
  Serial.println("  write <b0> [b1 ...]       - Write bytes");
  Serial.println("  reg <reg> <n>             - Register read (one round trip)");
  Serial.println("  txn <reg> <n>             - [Write(reg), Read(n)] transaction");
  Serial.println("  block <reg> [max]         - SMBus block read");
  Serial.println("  ten w <addr> <b0> [...]   - 10-bit write");
  Serial.println("  ten r <addr> <n>          - 10-bit read (header write + read)");
  Serial.println("  retries                   - Show retry policy");
  Serial.println("  health [reset]            - Show or reset bus health");
  Serial.println("  verbose [0|1]             - Enable/disable verbose output");
}

// ============================================================================
// Command Processing
// ============================================================================

void processCommand(const String& cmdLine) {
  String line = cmdLine;
  line.trim();
  if (line.length() == 0) {
    return;
  }

  String tokens[MAX_BYTES + 3];
  const size_t count = tokenize(line, tokens, MAX_BYTES + 3);
  const String& cmd = tokens[0];

  if (cmd == "help" || cmd == "?") {
    printHelp();
    return;
  }

  if (cmd == "scan") {
    i2c::scan();
    return;
  }

  if (cmd == "addr") {
    uint8_t raw = 0;
    if (count < 2 || !parseByte(tokens[1], raw)) {
      LOGW("Usage: addr <0x08-0x77>");
      return;
    }
    SevenBitAddr addr;
    const I2cBridge::AddressStatus ast = SevenBitAddr::tryNew(raw, addr);
    if (!ast.ok()) {
      char msg[64];
      I2cBridge::formatAddressStatus(ast, msg, sizeof(msg));
      LOGE("%s", msg);
      return;
    }
    gTarget.address = addr.get();
    printStatus(bindDevice());
    printTarget();
    return;
  }

  if (cmd == "probe") {
    uint8_t b = 0;
    const Status st = fastPath().bridge().read(SevenBitAddr(gTarget.address), &b, 1);
    Serial.printf("  Probe 0x%02X: %s\n", gTarget.address, st.ok() ? "ACK" : "no response");
    if (!st.ok() && verboseMode) {
      printStatus(st);
    }
    return;
  }

  if (cmd == "read") {
    uint32_t n = 0;
    if (count < 2 || !parseU32(tokens[1], n) || n == 0 || n > MAX_BYTES) {
      LOGW("Usage: read <1-%u>", static_cast<unsigned>(MAX_BYTES));
      return;
    }
    uint8_t buf[MAX_BYTES] = {};
    const Status st = gBus.read(SevenBitAddr(gTarget.address), buf, n);
    printStatus(st);
    if (st.ok()) {
      printBytes(buf, n);
    }
    return;
  }

  if (cmd == "write") {
    uint8_t data[MAX_BYTES] = {};
    size_t len = 0;
    if (count < 2 || !parseBytes(tokens, 1, count, data, len)) {
      LOGW("Usage: write <b0> [b1 ...]");
      return;
    }
    printStatus(gBus.write(SevenBitAddr(gTarget.address), data, len));
    return;
  }

  if (cmd == "reg" || cmd == "txn") {
    uint8_t reg = 0;
    uint32_t n = 0;
    if (count < 3 || !parseByte(tokens[1], reg) || !parseU32(tokens[2], n) || n == 0 ||
        n > MAX_BYTES) {
      LOGW("Usage: %s <reg> <1-%u>", cmd.c_str(), static_cast<unsigned>(MAX_BYTES));
      return;
    }
    uint8_t buf[MAX_BYTES] = {};
    const uint32_t start = millis();
    Status st;
    if (cmd == "reg") {
      st = gBus.writeRead(SevenBitAddr(gTarget.address), &reg, 1, buf, n);
    } else {
      const Operation ops[2] = {Operation::Write(&reg, 1), Operation::Read(buf, n)};
      st = gBus.transaction(SevenBitAddr(gTarget.address), ops, 2);
    }
    printStatus(st);
    if (st.ok()) {
      printBytes(buf, n);
    }
    LOGV(verboseMode, "took %lu ms", static_cast<unsigned long>(millis() - start));
    return;
  }

  if (cmd == "block") {
    uint8_t reg = 0;
    uint32_t max = MAX_BYTES;
    if (count < 2 || !parseByte(tokens[1], reg) ||
        (count >= 3 && (!parseU32(tokens[2], max) || max == 0 || max > MAX_BYTES))) {
      LOGW("Usage: block <reg> [max]");
      return;
    }
    uint8_t buf[MAX_BYTES] = {};
    size_t got = 0;
    const Status st = fastPath().readBlock(reg, buf, max, got);
    printStatus(st);
    if (st.ok()) {
      Serial.printf("  Count: %u\n", static_cast<unsigned>(got));
      printBytes(buf, got);
    }
    return;
  }

  if (cmd == "ten") {
    uint32_t raw = 0;
    if (count < 4 || !parseU32(tokens[2], raw) || raw > 0xFFFF) {
      LOGW("Usage: ten w <addr> <bytes...> | ten r <addr> <n>");
      return;
    }
    TenBitAddr addr;
    const I2cBridge::AddressStatus ast = TenBitAddr::tryNew(static_cast<uint16_t>(raw), addr);
    if (!ast.ok()) {
      char msg[64];
      I2cBridge::formatAddressStatus(ast, msg, sizeof(msg));
      LOGE("%s", msg);
      return;
    }
    uint8_t header[2];
    I2cBridge::DeviceBridge::tenBitHeader(addr, header);
    LOGV(verboseMode, "10-bit header %02X %02X", header[0], header[1]);

    if (tokens[1] == "w") {
      uint8_t data[MAX_BYTES] = {};
      size_t len = 0;
      if (!parseBytes(tokens, 3, count, data, len)) {
        LOGW("Invalid byte list");
        return;
      }
      printStatus(fastPath().bridge().write(addr, data, len));
    } else if (tokens[1] == "r") {
      uint32_t n = 0;
      if (!parseU32(tokens[3], n) || n == 0 || n > MAX_BYTES) {
        LOGW("Usage: ten r <addr> <1-%u>", static_cast<unsigned>(MAX_BYTES));
        return;
      }
      uint8_t buf[MAX_BYTES] = {};
      const Status st = fastPath().bridge().read(addr, buf, n);
      printStatus(st);
      if (st.ok()) {
        printBytes(buf, n);
      }
    } else {
      LOGW("Usage: ten w <addr> <bytes...> | ten r <addr> <n>");
    }
    return;
  }

  if (cmd == "retries") {
    printRetryConfig();
    return;
  }

  if (cmd == "health") {
    if (count >= 2 && tokens[1] == "reset") {
      gBus.resetHealth();
    }
    printDriverHealth();
    return;
  }

  if (cmd == "verbose") {
    if (count >= 2) {
      verboseMode = (tokens[1] == "1");
    }
    LOGI("Verbose: %s", verboseMode ? "ON" : "OFF");
    return;
  }

  LOGW("Unknown command: %s", cmd.c_str());
}

// ============================================================================
// Setup and Loop
// ============================================================================

void setup() {
  log_begin(115200);

  LOGI("=== I2cBridge Bringup Example (v%s) ===", I2cBridge::VERSION);

  if (!board::initI2c()) {
    LOGE("Failed to initialize I2C");
    return;
  }
  LOGI("I2C initialized (SDA=%d, SCL=%d)", board::I2C_SDA, board::I2C_SCL);

  i2c::scan();

  const Status st = bindDevice();
  if (!st.ok()) {
    LOGE("Failed to bind device handle");
    printStatus(st);
    return;
  }

  LOGI("Device handle bound");
  printTarget();
  printDriverHealth();
  printHelp();
  Serial.print("> ");
}

void loop() {
  static String inputBuffer;
  while (Serial.available()) {
    const char c = static_cast<char>(Serial.read());
    if (c == '\n' || c == '\r') {
      if (inputBuffer.length() > 0) {
        processCommand(inputBuffer);
        inputBuffer = "";
        Serial.print("> ");
      }
    } else {
      inputBuffer += c;
    }
  }
}
