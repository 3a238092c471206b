#pragma once

#include <stdint.h>

// Printed legend of the common 4x4 membrane keypad, indexed by key code:
//
//   1 2 3 A
//   4 5 6 B
//   7 8 9 C
//   * 0 # D
//
// Returns '?' for codes above 0xF.
char keyLabel(uint8_t code);

// Reverse lookup; letters match either case.
bool keyCodeForLabel(char label, uint8_t *code);
