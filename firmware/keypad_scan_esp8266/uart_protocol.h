#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>

#include "keypad_scanner.h"

// Newline-delimited JSON over a Stream.
//
//   Rx: {"cmd":"keypad.reset","cmdId":"42","args":{...}}
//   Tx: {"evt":"cmd_result"|"event"|"state", ...}
//
// Anything that does not parse as JSON (boot noise, log lines) is ignored.
class UartProtocol {
public:
  using CommandHandler = void (*)(const char *cmd, const char *cmdId, JsonVariantConst args);

  void begin(Stream &s);
  void setCommandHandler(CommandHandler h) { _onCmd = h; }

  // call often in loop
  void tick();

  // Tx helpers
  void sendCmdResult(const char *cmdId, bool ok, const char *errorMsg = nullptr);
  void sendEvent(const char *type, JsonVariantConst data);
  void sendState(JsonVariantConst state);

  void sendKey(const DecodedKey &key, uint32_t cycle);
  void sendTrace(const ScanOutputs &out, uint32_t cycle);

  uint32_t droppedLines() const { return _dropped; }

private:
  void handleLine(const char *line);
  void sendJsonLine(JsonDocument &doc);

  Stream *_s = nullptr;
  CommandHandler _onCmd = nullptr;

  static constexpr size_t kMaxLine = 256;
  char _lineBuf[kMaxLine];
  size_t _lineLen = 0;
  uint32_t _dropped = 0;
};
