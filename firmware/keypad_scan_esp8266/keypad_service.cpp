#include "keypad_service.h"

#include "key_legend.h"
#include "pins.h"

// Rate limit for "[Keypad] sample failed" lines
static constexpr uint32_t kFailLogIntervalMs = 2000;

void KeypadService::begin(MatrixSampler &sampler, KeypadScanner &scanner, UartProtocol &uart) {
  _sampler = &sampler;
  _scanner = &scanner;
  _uart = &uart;

  _traceEnabled = KEYSCAN_TRACE_DEFAULT;
  _resetPending = false;
  _nextEdgeUs = micros();

  _scanner->begin();
  sendState();
}

void KeypadService::tick() {
  const uint32_t nowUs = micros();
  if ((int32_t)(nowUs - _nextEdgeUs) < 0) return;
  _nextEdgeUs = nowUs + KEYSCAN_CLOCK_PERIOD_US;

  runEdge();
}

void KeypadService::runEdge() {
  if (!_sampler || !_scanner) return;

  KeyMatrix keys = 0;
  if (!_sampler->sample(&keys)) {
    // No snapshot -> no edge; state stays where it is.
    _sampleFailures++;
#if KEYSCAN_DEBUG_LOG
    const uint32_t now = millis();
    if ((int32_t)(now - _lastFailLogMs) >= (int32_t)kFailLogIntervalMs) {
      _lastFailLogMs = now;
      Serial.printf("[Keypad] sample failed (total=%u)\n", (unsigned)_sampleFailures);
    }
#endif
    return;
  }

  const bool reset = _resetPending;
  _resetPending = false;

  const ScanOutputs out = _scanner->clock(keys, reset);

  if (reset) {
#if KEYSCAN_DEBUG_LOG
    Serial.println("[Keypad] reset");
#endif
    sendState();
  }

  if (out.key.valid && _uart) {
#if KEYSCAN_DEBUG_LOG
    Serial.printf("[Keypad] key 0x%X '%c'\n", out.key.code, keyLabel(out.key.code));
#endif
    _uart->sendKey(out.key, _scanner->cycles());
  }
}

void KeypadService::onCycle(const ScanOutputs &out) {
  if (!_traceEnabled || !_uart || !_scanner) return;
  _uart->sendTrace(out, _scanner->cycles());
}

void KeypadService::sendState() {
  if (!_uart || !_scanner) return;

  StaticJsonDocument<192> s;
  s["state"] = ScanController::stateName(_scanner->state());
  s["cols"] = _scanner->columns();
  s["cycles"] = _scanner->cycles();
  s["keyEvents"] = _scanner->keyEvents();
  s["trace"] = _traceEnabled;

  JsonObject errors = s.createNestedObject("errors");
  errors["sample"] = _sampleFailures;
  errors["bus"] = _sampler ? _sampler->errorCount() : 0;
  errors["rxDropped"] = _uart->droppedLines();

  _uart->sendState(s.as<JsonVariantConst>());
}

void KeypadService::onCommand(const char *cmd, const char *cmdId, JsonVariantConst args) {
  if (!cmd || !cmdId || !cmdId[0]) {
    return;
  }

  bool ok = false;
  const char *err = nullptr;

  if (strcmp(cmd, "keypad.reset") == 0) {
    // Applied as a reset level on the next edge
    _resetPending = true;
    ok = true;
  } else if (strcmp(cmd, "keypad.trace") == 0) {
    if (!args["enable"].is<bool>()) {
      err = "bad_enable";
    } else {
      _traceEnabled = args["enable"].as<bool>();
      ok = true;
    }
  } else if (strcmp(cmd, "keypad.state") == 0) {
    ok = true;
  } else {
    err = "unknown_cmd";
  }

  if (_uart) _uart->sendCmdResult(cmdId, ok, err);

  sendState();
}
