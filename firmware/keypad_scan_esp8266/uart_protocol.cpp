#include "uart_protocol.h"

#include "key_legend.h"

void UartProtocol::begin(Stream &s) {
  _s = &s;
  _lineLen = 0;
}

void UartProtocol::tick() {
  if (!_s) return;
  while (_s->available()) {
    const int c = _s->read();
    if (c < 0) break;

    if (c == '\r') continue;

    if (c == '\n') {
      if (_lineLen > 0) {
        _lineBuf[_lineLen] = '\0';
        handleLine(_lineBuf);
      }
      _lineLen = 0;
      continue;
    }

    if (_lineLen < kMaxLine - 1) {
      _lineBuf[_lineLen++] = (char)c;
    } else {
      // overflow -> drop
      _lineLen = 0;
      _dropped++;
    }
  }
}

void UartProtocol::handleLine(const char *line) {
  StaticJsonDocument<256> doc;
  DeserializationError err = deserializeJson(doc, line);
  if (err) return;

  const char *cmd = doc["cmd"].as<const char *>();
  if (!cmd) return;

  const char *cmdId = doc["cmdId"] | "";
  if (_onCmd) {
    _onCmd(cmd, cmdId, doc["args"]);
  }
}

void UartProtocol::sendJsonLine(JsonDocument &doc) {
  if (!_s) return;
  serializeJson(doc, *_s);
  _s->print('\n');
}

void UartProtocol::sendCmdResult(const char *cmdId, bool ok, const char *errorMsg) {
  StaticJsonDocument<128> doc;
  doc["evt"] = "cmd_result";
  doc["cmdId"] = cmdId ? cmdId : "";
  doc["ok"] = ok;
  if (!ok && errorMsg && errorMsg[0] != '\0') {
    doc["error"] = errorMsg;
  }
  sendJsonLine(doc);
}

void UartProtocol::sendEvent(const char *type, JsonVariantConst data) {
  StaticJsonDocument<256> doc;
  doc["evt"] = "event";
  doc["type"] = type;
  if (!data.isNull()) {
    doc["data"] = data;
  }
  sendJsonLine(doc);
}

void UartProtocol::sendState(JsonVariantConst state) {
  StaticJsonDocument<256> doc;
  doc["evt"] = "state";
  doc["state"] = state;
  sendJsonLine(doc);
}

void UartProtocol::sendKey(const DecodedKey &key, uint32_t cycle) {
  if (!key.valid) return;

  // label as a 1-char string
  const char label[2] = {keyLabel(key.code), '\0'};

  StaticJsonDocument<96> data;
  data["code"] = key.code;
  data["label"] = label;
  data["cycle"] = cycle;
  sendEvent("keypad.key", data.as<JsonVariantConst>());
}

void UartProtocol::sendTrace(const ScanOutputs &out, uint32_t cycle) {
  StaticJsonDocument<160> data;
  data["cycle"] = cycle;
  data["state"] = ScanController::stateName(out.state);
  data["cols"] = out.columns;
  data["rows"] = out.rows;
  data["stable"] = out.stable;
  data["code"] = out.key.code;
  data["valid"] = out.key.valid;
  sendEvent("keypad.trace", data.as<JsonVariantConst>());
}
