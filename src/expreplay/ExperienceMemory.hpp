#pragma once

#include "../common/Common.hpp"
#include "BatchAssembler.hpp"
#include "ExperienceMoment.hpp"
#include "MemorySpec.hpp"
#include "RingStore.hpp"

#include <boost/thread/shared_mutex.hpp>
#include <cstdint>
#include <mutex>
#include <random>

namespace expreplay {

// Thread-safe replay memory for a single producer and any number of consumers. Adding takes an
// exclusive lock, sampling a shared one held across index selection and the copy-out, so a
// concurrent add can never overwrite an entry that is being sampled.
class ExperienceMemory {
  mutable boost::shared_mutex mutex;
  RingStore store;

  // Only used when a fixed seed is configured; otherwise each thread draws from its own generator.
  bool seeded;
  mutable std::mutex rngMutex;
  mutable std::mt19937 seededRng;

public:
  // Both throw ConstructionError for a capacity that is not positive.
  explicit ExperienceMemory(long long maxSize);
  explicit ExperienceMemory(const MemorySpec &spec);
  ~ExperienceMemory() = default;

  ExperienceMemory(const ExperienceMemory &other) = delete;
  ExperienceMemory(ExperienceMemory &&other) = delete;
  ExperienceMemory &operator=(const ExperienceMemory &other) = delete;

  void AddExperience(const ExperienceMoment &moment);
  void AddExperience(const EVector &state, const EVector &action, float reward,
                     const EVector &nextState, bool done);
  void AddExperiences(const vector<ExperienceMoment> &moments);

  // Both throw InsufficientSamples unless 0 < numSamples <= NumMemories().
  vector<ExperienceMoment> Sample(unsigned numSamples) const;
  vector<ExperienceMoment> Sample(unsigned numSamples, std::mt19937 &rng) const;

  Batch SampleBatch(unsigned numSamples) const;
  Batch SampleBatch(unsigned numSamples, std::mt19937 &rng) const;

  // Live entries, oldest first.
  vector<ExperienceMoment> Snapshot(void) const;

  unsigned NumMemories(void) const;
  unsigned Capacity(void) const;
  uint64_t TotalAdded(void) const;
  bool IsReady(unsigned minSize) const;

private:
  vector<ExperienceMoment> sampleWithDefaultRng(unsigned numSamples) const;
};
}
