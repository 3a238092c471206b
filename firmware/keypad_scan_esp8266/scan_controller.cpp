#include "scan_controller.h"

// Row-major code table, [row][col]
static const uint8_t kKeyCodes[kKeypadRows][kKeypadCols] = {
    {0x0, 0x1, 0x2, 0x3},
    {0x4, 0x5, 0x6, 0x7},
    {0x8, 0x9, 0xA, 0xB},
    {0xC, 0xD, 0xE, 0xF},
};

// Index of the single set bit in the low nibble, or -1.
static int singleLineIndex(uint8_t lines) {
  switch (lines & 0x0F) {
    case 0x1: return 0;
    case 0x2: return 1;
    case 0x4: return 2;
    case 0x8: return 3;
    default:  return -1;
  }
}

void ScanController::step(RowActivity rows, bool stable, bool reset) {
  if (reset) {
    _state = ScanState::Idle;
    return;
  }
  _state = nextState(_state, rows, stable);
}

ScanState ScanController::nextState(ScanState state, RowActivity rows, bool stable) {
  const bool active = (rows & 0x0F) != 0;

  switch (state) {
    case ScanState::Idle:
      return stable ? ScanState::ScanCol0 : ScanState::Idle;
    case ScanState::ScanCol0:
      return active ? ScanState::Hold : ScanState::ScanCol1;
    case ScanState::ScanCol1:
      return active ? ScanState::Hold : ScanState::ScanCol2;
    case ScanState::ScanCol2:
      return active ? ScanState::Hold : ScanState::ScanCol3;
    case ScanState::ScanCol3:
      return active ? ScanState::Hold : ScanState::Idle;
    case ScanState::Hold:
      return active ? ScanState::Hold : ScanState::Idle;
  }
  return ScanState::Idle;
}

ColumnDrive ScanController::columnsFor(ScanState state) {
  switch (state) {
    case ScanState::ScanCol0: return 0x1;
    case ScanState::ScanCol1: return 0x2;
    case ScanState::ScanCol2: return 0x4;
    case ScanState::ScanCol3: return 0x8;
    case ScanState::Idle:
    case ScanState::Hold:
      break;
  }
  return kAllColumns;
}

bool ScanController::isScanning(ScanState state) {
  return state == ScanState::ScanCol0 || state == ScanState::ScanCol1 ||
         state == ScanState::ScanCol2 || state == ScanState::ScanCol3;
}

DecodedKey ScanController::decodeKey(ScanState state, RowActivity rows) {
  DecodedKey out;
  if (!isScanning(state)) return out;

  const int row = singleLineIndex(rows);
  const int col = singleLineIndex(columnsFor(state));
  if (row < 0 || col < 0) return out;

  out.code = kKeyCodes[row][col];
  out.valid = true;
  return out;
}

const char *ScanController::stateName(ScanState state) {
  switch (state) {
    case ScanState::Idle:     return "IDLE";
    case ScanState::ScanCol0: return "SCAN0";
    case ScanState::ScanCol1: return "SCAN1";
    case ScanState::ScanCol2: return "SCAN2";
    case ScanState::ScanCol3: return "SCAN3";
    case ScanState::Hold:     return "HOLD";
  }
  return "?";
}
