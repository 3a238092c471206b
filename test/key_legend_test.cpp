#include <gtest/gtest.h>

#include "key_legend.h"

TEST(KeyLegend, MembraneLayout) {
  EXPECT_EQ(keyLabel(0x0), '1');
  EXPECT_EQ(keyLabel(0x3), 'A');
  EXPECT_EQ(keyLabel(0x5), '5');
  EXPECT_EQ(keyLabel(0xA), '9');
  EXPECT_EQ(keyLabel(0xC), '*');
  EXPECT_EQ(keyLabel(0xD), '0');
  EXPECT_EQ(keyLabel(0xE), '#');
  EXPECT_EQ(keyLabel(0xF), 'D');
}

TEST(KeyLegend, OutOfRangeCode) {
  EXPECT_EQ(keyLabel(0x10), '?');
  EXPECT_EQ(keyLabel(0xFF), '?');
}

TEST(KeyLegend, ReverseLookupAllLabels) {
  for (uint8_t code = 0; code < 16; code++) {
    uint8_t back = 0xFF;
    ASSERT_TRUE(keyCodeForLabel(keyLabel(code), &back));
    EXPECT_EQ(back, code);
  }
}

TEST(KeyLegend, LowercaseLetters) {
  uint8_t code = 0;
  ASSERT_TRUE(keyCodeForLabel('b', &code));
  EXPECT_EQ(code, 0x7);
}

TEST(KeyLegend, UnknownLabel) {
  uint8_t code = 0x3;
  EXPECT_FALSE(keyCodeForLabel('x', &code));
  EXPECT_EQ(code, 0x3);
  EXPECT_FALSE(keyCodeForLabel('1', nullptr));
}
