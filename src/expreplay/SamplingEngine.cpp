#include "SamplingEngine.hpp"
#include "Errors.hpp"

#include <cassert>
#include <string>
#include <unordered_map>

using namespace expreplay;

vector<unsigned> SamplingEngine::SampleIndices(unsigned size, unsigned k, std::mt19937 &rng) {
  if (k == 0 || k > size) {
    throw InsufficientSamples("cannot sample " + std::to_string(k) + " entries from " +
                              std::to_string(size));
  }

  // Partial Fisher-Yates over the virtual array [0, size). Only positions that have been swapped
  // away from their identity value are stored, so at most k entries end up in the map.
  std::unordered_map<unsigned, unsigned> displaced;
  displaced.reserve(k);

  auto valueAt = [&displaced](unsigned pos) {
    auto it = displaced.find(pos);
    return it == displaced.end() ? pos : it->second;
  };

  vector<unsigned> result;
  result.reserve(k);

  for (unsigned i = 0; i < k; i++) {
    std::uniform_int_distribution<unsigned> dist(i, size - 1);
    unsigned j = dist(rng);

    unsigned vi = valueAt(i);
    unsigned vj = valueAt(j);

    result.push_back(vj);
    // Position i is never visited again, so only j needs to remember the swapped-out value.
    displaced[j] = vi;
  }

  assert(result.size() == k);
  return result;
}

vector<ExperienceMoment> SamplingEngine::Sample(const RingStore &store, unsigned k,
                                                std::mt19937 &rng) {
  vector<unsigned> indices = SampleIndices(store.Size(), k, rng);

  vector<ExperienceMoment> result;
  result.reserve(k);
  for (unsigned index : indices) {
    result.push_back(store.At(index));
  }
  return result;
}
