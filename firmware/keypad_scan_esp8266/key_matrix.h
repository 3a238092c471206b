#pragma once

#include <stdint.h>

// 4x4 matrix geometry and the bit vectors passed between the scan stages.
//
// KeyMatrix is row-major: bit (row * 4 + col) is set while that key is closed.
// ColumnDrive bit c asserts column c. RowActivity bit r means row r responds.

static constexpr uint8_t kKeypadRows = 4;
static constexpr uint8_t kKeypadCols = 4;

using KeyMatrix = uint16_t;
using ColumnDrive = uint8_t;
using RowActivity = uint8_t;

static constexpr ColumnDrive kAllColumns = 0x0F;

inline uint8_t keyIndex(uint8_t row, uint8_t col) {
  return (uint8_t)(row * kKeypadCols + col);
}

inline bool isKeyPressed(KeyMatrix keys, uint8_t row, uint8_t col) {
  return ((keys >> keyIndex(row, col)) & 0x01) != 0;
}

inline KeyMatrix withKey(KeyMatrix keys, uint8_t row, uint8_t col, bool pressed) {
  const KeyMatrix bit = (KeyMatrix)(1u << keyIndex(row, col));
  return pressed ? (KeyMatrix)(keys | bit) : (KeyMatrix)(keys & ~bit);
}
