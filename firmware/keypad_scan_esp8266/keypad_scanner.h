#pragma once

#include <stdint.h>

#include "edge_synchronizer.h"
#include "key_matrix.h"
#include "scan_controller.h"

// Everything observable during one clock cycle.
struct ScanOutputs {
  ColumnDrive columns = kAllColumns;
  RowActivity rows = 0;
  bool stable = false;   // synchronizer output consumed by this edge
  ScanState state = ScanState::Idle;
  DecodedKey key;
};

// One 4x4 keypad: row detection, synchronizer and scan FSM clocked together.
//
// Per edge, in order:
//   1. rows from the key snapshot and the current column drive
//   2. synchronizer shifts in (rows != 0)
//   3. scan FSM commits, using the synchronizer output from before this edge
class KeypadScanner {
public:
  using TraceHook = void (*)(const ScanOutputs &out);

  // Power-on reset; also clears the counters.
  void begin();

  // One clock edge. Returns what was observable in the cycle this edge closes.
  ScanOutputs clock(KeyMatrix keys, bool reset);

  // Called once per edge with the returned outputs.
  void setTraceHook(TraceHook hook) { _traceHook = hook; }

  const ScanOutputs &last() const { return _last; }
  ScanState state() const { return _controller.state(); }
  ColumnDrive columns() const { return _controller.columns(); }

  const EdgeSynchronizer &synchronizer() const { return _sync; }

  uint32_t cycles() const { return _cycles; }
  uint32_t keyEvents() const { return _keyEvents; }

private:
  EdgeSynchronizer _sync;
  ScanController _controller;

  ScanOutputs _last;
  TraceHook _traceHook = nullptr;

  uint32_t _cycles = 0;
  uint32_t _keyEvents = 0;
};
