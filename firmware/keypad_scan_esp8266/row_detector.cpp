#include "row_detector.h"

RowActivity detectRows(KeyMatrix keys, ColumnDrive columns) {
  RowActivity rows = 0;
  for (uint8_t row = 0; row < kKeypadRows; row++) {
    // The 4 key bits of this row line up with the column drive bits.
    const uint8_t rowKeys = (uint8_t)((keys >> (row * kKeypadCols)) & 0x0F);
    if (rowKeys & columns & kAllColumns) {
      rows |= (uint8_t)(1u << row);
    }
  }
  return rows;
}
