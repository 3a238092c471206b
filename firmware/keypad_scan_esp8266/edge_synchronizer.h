#pragma once

#include <stdint.h>

// Two-stage synchronizer for the asynchronous "any row active" level.
//
// Each clock edge shifts the raw level into stage1 and stage1 into stage2.
// The stable output is stage2, so a raw change during cycle N is consumed as
// true by the scan controller at the edge of cycle N+2.
class EdgeSynchronizer {
public:
  // Advance one clock edge. Reset clears both stages and takes priority.
  // Returns the stable output as committed by this edge.
  bool step(bool rowActivityAny, bool reset);

  void reset();

  bool stable() const { return _stage2; }
  bool stage1() const { return _stage1; }
  bool stage2() const { return _stage2; }

private:
  bool _stage1 = false;
  bool _stage2 = false;
};
