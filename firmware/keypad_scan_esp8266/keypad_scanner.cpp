#include "keypad_scanner.h"

#include "row_detector.h"

void KeypadScanner::begin() {
  _sync.reset();
  _controller.reset();
  _last = ScanOutputs();
  _cycles = 0;
  _keyEvents = 0;
}

ScanOutputs KeypadScanner::clock(KeyMatrix keys, bool reset) {
  ScanOutputs out;
  out.state = _controller.state();
  out.columns = _controller.columns();
  out.rows = detectRows(keys, out.columns);
  out.stable = _sync.stable();
  out.key = _controller.decode(out.rows);

  _sync.step(out.rows != 0, reset);
  _controller.step(out.rows, out.stable, reset);

  _cycles++;
  if (out.key.valid) _keyEvents++;

  _last = out;
  if (_traceHook) _traceHook(out);
  return out;
}
