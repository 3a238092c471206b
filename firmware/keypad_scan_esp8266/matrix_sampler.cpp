#include "matrix_sampler.h"

#include <Wire.h>

#include "pins.h"

#if KEYSCAN_PIN_PROFILE == 1

static bool pcfWrite(uint8_t addr, uint8_t value) {
  Wire.beginTransmission(addr);
  Wire.write(value);
  return Wire.endTransmission() == 0;
}

static bool pcfRead(uint8_t addr, uint8_t *out) {
  if (Wire.requestFrom((int)addr, 1) != 1) return false;
  if (!Wire.available()) return false;
  *out = (uint8_t)Wire.read();
  return true;
}

bool MatrixSampler::begin() {
  // All HIGH: columns released, rows as inputs
  return driveColumn(-1);
}

bool MatrixSampler::driveColumn(int8_t col) {
  uint8_t out = 0xFF;
  if (col >= 0) out &= ~(1u << col);
  return pcfWrite(KEYSCAN_PCF8574_ADDR, out);
}

bool MatrixSampler::readRows(uint8_t *rows) {
  uint8_t in = 0xFF;
  if (!pcfRead(KEYSCAN_PCF8574_ADDR, &in)) return false;
  *rows = (uint8_t)((~in >> 4) & 0x0F);
  return true;
}

#else

static const uint8_t kColPins[kKeypadCols] = {
    KEYSCAN_COL0_PIN, KEYSCAN_COL1_PIN, KEYSCAN_COL2_PIN, KEYSCAN_COL3_PIN};
static const uint8_t kRowPins[kKeypadRows] = {
    KEYSCAN_ROW0_PIN, KEYSCAN_ROW1_PIN, KEYSCAN_ROW2_PIN, KEYSCAN_ROW3_PIN};

bool MatrixSampler::begin() {
  for (uint8_t r = 0; r < kKeypadRows; r++) {
    pinMode(kRowPins[r], INPUT_PULLUP);
  }
  for (uint8_t c = 0; c < kKeypadCols; c++) {
    pinMode(kColPins[c], OUTPUT);
  }
  return driveColumn(-1);
}

bool MatrixSampler::driveColumn(int8_t col) {
  for (uint8_t c = 0; c < kKeypadCols; c++) {
    digitalWrite(kColPins[c], (int8_t)c == col ? LOW : HIGH);
  }
  return true;
}

bool MatrixSampler::readRows(uint8_t *rows) {
  uint8_t v = 0;
  for (uint8_t r = 0; r < kKeypadRows; r++) {
    if (digitalRead(kRowPins[r]) == LOW) v |= (uint8_t)(1u << r);
  }
  *rows = v;
  return true;
}

#endif

bool MatrixSampler::fail() {
  _errors++;
  driveColumn(-1);
  return false;
}

bool MatrixSampler::sample(KeyMatrix *out) {
  if (!out) return false;

  KeyMatrix keys = 0;
  for (uint8_t col = 0; col < kKeypadCols; col++) {
    if (!driveColumn((int8_t)col)) return fail();

    delayMicroseconds(KEYSCAN_SETTLE_US);

    uint8_t rows = 0;
    if (!readRows(&rows)) return fail();

    for (uint8_t row = 0; row < kKeypadRows; row++) {
      if (rows & (1u << row)) keys = withKey(keys, row, col, true);
    }
  }

  if (!driveColumn(-1)) return fail();
  *out = keys;
  return true;
}
