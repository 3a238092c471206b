#pragma once

/*
  Keypad scanner (ESP8266) pin profiles

  ESP8266 boot strap pins:
    - GPIO0  (D3) must be HIGH at boot
    - GPIO2  (D4) must be HIGH at boot
    - GPIO15 (D8) must be LOW  at boot

  Select the profile at compile time:
    -DKEYSCAN_PIN_PROFILE=1  (PCF8574 expander, recommended)
    -DKEYSCAN_PIN_PROFILE=2  (direct GPIO)

  Both profiles use active-low scanning: the probed column is driven LOW and
  rows are read through pull-ups, so a LOW row means a closed key.

  Board: NodeMCU / Wemos D1 mini (ESP8266)
*/

#ifndef KEYSCAN_PIN_PROFILE
#define KEYSCAN_PIN_PROFILE 1
#endif

// ------------------ Shared config ------------------

// UART link (newline JSON + "[Keypad]" log lines)
#define KEYSCAN_UART_BAUD 115200

// One scan clock edge per period (microseconds)
#ifndef KEYSCAN_CLOCK_PERIOD_US
#define KEYSCAN_CLOCK_PERIOD_US 1000
#endif

// Settling time between driving a column and reading the rows
#define KEYSCAN_SETTLE_US 80

// Per-cycle trace records on boot (can be toggled with keypad.trace)
#ifndef KEYSCAN_TRACE_DEFAULT
#define KEYSCAN_TRACE_DEFAULT 0
#endif

#ifndef KEYSCAN_DEBUG_LOG
#define KEYSCAN_DEBUG_LOG 1
#endif

// ------------------ PROFILE 1 (PCF8574) ------------------

#if KEYSCAN_PIN_PROFILE == 1

// PCF8574 mapping:
//   P0..P3 = COL0..COL3 (driven)
//   P4..P7 = ROW0..ROW3 (quasi-bidirectional inputs, written HIGH)
#define KEYSCAN_PCF8574_ADDR 0x20
#define I2C_SDA_PIN 4   // D2
#define I2C_SCL_PIN 5   // D1

// ------------------ PROFILE 2 (direct GPIO) ------------------

#elif KEYSCAN_PIN_PROFILE == 2

#define KEYSCAN_COL0_PIN 14  // D5
#define KEYSCAN_COL1_PIN 12  // D6
#define KEYSCAN_COL2_PIN 13  // D7
#define KEYSCAN_COL3_PIN 16  // D0 (no pull-up needed, output only)

// NOTE: ROW2/ROW3 sit on GPIO0/GPIO2; do not hold a key in those rows at boot.
#define KEYSCAN_ROW0_PIN 5   // D1
#define KEYSCAN_ROW1_PIN 4   // D2
#define KEYSCAN_ROW2_PIN 0   // D3
#define KEYSCAN_ROW3_PIN 2   // D4

#else
#error "KEYSCAN_PIN_PROFILE must be 1 or 2"
#endif
