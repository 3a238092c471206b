#include <gtest/gtest.h>

#include "row_detector.h"

TEST(RowDetector, NoKeysNoRows) {
  EXPECT_EQ(detectRows(0, kAllColumns), 0);
  EXPECT_EQ(detectRows(0, 0x1), 0);
}

TEST(RowDetector, SingleKeyOnlyOnItsColumn) {
  for (uint8_t row = 0; row < kKeypadRows; row++) {
    for (uint8_t col = 0; col < kKeypadCols; col++) {
      const KeyMatrix keys = withKey(0, row, col, true);
      for (uint8_t probe = 0; probe < kKeypadCols; probe++) {
        const RowActivity expected = (probe == col) ? (RowActivity)(1u << row) : 0;
        EXPECT_EQ(detectRows(keys, (ColumnDrive)(1u << probe)), expected)
            << "row=" << int(row) << " col=" << int(col) << " probe=" << int(probe);
      }
      EXPECT_EQ(detectRows(keys, kAllColumns), (RowActivity)(1u << row));
    }
  }
}

TEST(RowDetector, NoColumnsDrivenReadsNothing) {
  EXPECT_EQ(detectRows(0xFFFF, 0), 0);
}

TEST(RowDetector, AllKeysAllColumns) {
  EXPECT_EQ(detectRows(0xFFFF, kAllColumns), 0x0F);
  EXPECT_EQ(detectRows(0xFFFF, 0x4), 0x0F);
}

TEST(RowDetector, SameColumnTwoRows) {
  KeyMatrix keys = withKey(0, 0, 2, true);
  keys = withKey(keys, 3, 2, true);
  EXPECT_EQ(detectRows(keys, 0x4), 0x09);
  EXPECT_EQ(detectRows(keys, 0x2), 0);
}

TEST(RowDetector, IgnoresHighColumnBits) {
  const KeyMatrix keys = withKey(0, 1, 0, true);
  EXPECT_EQ(detectRows(keys, 0xF0), 0);
}
