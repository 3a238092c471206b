#pragma once

#include <Arduino.h>
#include <ArduinoJson.h>

#include "keypad_scanner.h"
#include "matrix_sampler.h"
#include "uart_protocol.h"

// Clocks the scanner from loop() and reports over UART.
class KeypadService {
public:
  void begin(MatrixSampler &sampler, KeypadScanner &scanner, UartProtocol &uart);

  // Non-blocking: runs at most one scan edge per KEYSCAN_CLOCK_PERIOD_US.
  void tick();

  // UART commands: keypad.reset, keypad.trace, keypad.state
  void onCommand(const char *cmd, const char *cmdId, JsonVariantConst args);

  // Per-edge hook target
  void onCycle(const ScanOutputs &out);

private:
  void runEdge();
  void sendState();

  MatrixSampler *_sampler = nullptr;
  KeypadScanner *_scanner = nullptr;
  UartProtocol *_uart = nullptr;

  uint32_t _nextEdgeUs = 0;
  bool _resetPending = false;
  bool _traceEnabled = false;

  uint32_t _sampleFailures = 0;
  uint32_t _lastFailLogMs = 0;
};
