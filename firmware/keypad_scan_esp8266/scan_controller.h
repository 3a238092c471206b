#pragma once

#include <stdint.h>

#include "key_matrix.h"

enum class ScanState : uint8_t { Idle, ScanCol0, ScanCol1, ScanCol2, ScanCol3, Hold };

struct DecodedKey {
  uint8_t code = 0;    // 0x0..0xF, meaningful only while valid
  bool valid = false;
};

// Column scan state machine.
//
//   Idle      all columns   stable sync -> ScanCol0
//   ScanColN  column N      rows != 0 -> Hold, else next column (ScanCol3 -> Idle)
//   Hold      all columns   rows == 0 -> Idle
//
// Reset forces Idle. Hold is the debounce: the scan is not re-armed until every
// row reads released, so one press yields exactly one valid decode.
class ScanController {
public:
  void reset() { _state = ScanState::Idle; }

  // Commit the next state for one clock edge. `stable` is the synchronizer
  // output from before this edge.
  void step(RowActivity rows, bool stable, bool reset);

  ScanState state() const { return _state; }
  ColumnDrive columns() const { return columnsFor(_state); }
  DecodedKey decode(RowActivity rows) const { return decodeKey(_state, rows); }

  static ScanState nextState(ScanState state, RowActivity rows, bool stable);
  static ColumnDrive columnsFor(ScanState state);
  static bool isScanning(ScanState state);

  // Valid only in a ScanCol state with exactly one responding row. Multi-row
  // patterns have no table entry and decode as invalid.
  static DecodedKey decodeKey(ScanState state, RowActivity rows);

  static const char *stateName(ScanState state);

private:
  ScanState _state = ScanState::Idle;
};
