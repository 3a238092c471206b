#pragma once

#include <Arduino.h>

#include "key_matrix.h"

// Reads the physical 4x4 keypad into one KeyMatrix snapshot per call.
// Wiring is selected by KEYSCAN_PIN_PROFILE (see pins.h).
class MatrixSampler {
public:
  bool begin();

  // Full column sweep. Returns false on bus error; all lines are released
  // either way.
  bool sample(KeyMatrix *out);

  uint32_t errorCount() const { return _errors; }

private:
  bool driveColumn(int8_t col);  // -1 releases every column
  bool readRows(uint8_t *rows);  // bit r set = row r pulled low
  bool fail();

  uint32_t _errors = 0;
};
