#include "edge_synchronizer.h"

void EdgeSynchronizer::reset() {
  _stage1 = false;
  _stage2 = false;
}

bool EdgeSynchronizer::step(bool rowActivityAny, bool reset) {
  if (reset) {
    this->reset();
    return false;
  }

  // stage2 takes the value stage1 held before this edge
  _stage2 = _stage1;
  _stage1 = rowActivityAny;
  return _stage2;
}
