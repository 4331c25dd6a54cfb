#pragma once

#include "../common/Common.hpp"
#include "ExperienceMoment.hpp"
#include "RingStore.hpp"

#include <random>

namespace expreplay {

// Uniform sampling without replacement over the live window of a RingStore. Every k-subset of
// [0, size) is equally likely. Cost is O(k) time and space regardless of capacity.
class SamplingEngine {
public:
  // Returns k distinct logical indices in [0, size), in draw order.
  // Throws InsufficientSamples unless 0 < k <= size.
  static vector<unsigned> SampleIndices(unsigned size, unsigned k, std::mt19937 &rng);

  // Copies out the entries at k distinct logical indices of the store. The store is not modified.
  static vector<ExperienceMoment> Sample(const RingStore &store, unsigned k, std::mt19937 &rng);
};
}
