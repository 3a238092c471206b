#include "key_legend.h"

static const char kLegend[16] = {
    '1', '2', '3', 'A',
    '4', '5', '6', 'B',
    '7', '8', '9', 'C',
    '*', '0', '#', 'D',
};

char keyLabel(uint8_t code) {
  if (code >= sizeof(kLegend)) return '?';
  return kLegend[code];
}

bool keyCodeForLabel(char label, uint8_t *code) {
  if (!code) return false;
  if (label >= 'a' && label <= 'd') label = (char)(label - 'a' + 'A');

  for (uint8_t i = 0; i < sizeof(kLegend); i++) {
    if (kLegend[i] == label) {
      *code = i;
      return true;
    }
  }
  return false;
}
