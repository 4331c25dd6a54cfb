#pragma once

#include "../common/Common.hpp"
#include "../math/Math.hpp"
#include "ExperienceMoment.hpp"

namespace expreplay {

// Column-wise view of a sampled batch. Element i of every field comes from the i-th sampled
// moment.
struct Batch {
  vector<EVector> states;
  vector<EVector> actions;
  EVector rewards;
  vector<EVector> nextStates;
  vector<bool> dones;

  unsigned Size(void) const { return states.size(); }
};

class BatchAssembler {
public:
  // Throws EmptyBatch if moments is empty.
  static Batch Assemble(const vector<ExperienceMoment> &moments);

  // Packs equal-length vectors into a matrix with one row per vector.
  static EMatrix StackRows(const vector<EVector> &vectors);
};
}
