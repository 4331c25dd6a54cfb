#include "ExperienceMemory.hpp"
#include "SamplingEngine.hpp"

using namespace expreplay;

static std::mt19937 &threadRng(void) {
  thread_local std::mt19937 rng(std::random_device{}());
  return rng;
}

ExperienceMemory::ExperienceMemory(long long maxSize)
    : store(maxSize), seeded(false), seededRng(DEFAULT_SEED) {}

ExperienceMemory::ExperienceMemory(const MemorySpec &spec)
    : store(spec.capacity), seeded(spec.seed != 0), seededRng(spec.seed) {}

void ExperienceMemory::AddExperience(const ExperienceMoment &moment) {
  boost::upgrade_lock<boost::shared_mutex> lock(mutex);
  boost::upgrade_to_unique_lock<boost::shared_mutex> uniqueLock(lock);

  store.Append(moment);
}

void ExperienceMemory::AddExperience(const EVector &state, const EVector &action, float reward,
                                     const EVector &nextState, bool done) {
  AddExperience(ExperienceMoment(state, action, reward, nextState, done));
}

void ExperienceMemory::AddExperiences(const vector<ExperienceMoment> &moments) {
  boost::upgrade_lock<boost::shared_mutex> lock(mutex);
  boost::upgrade_to_unique_lock<boost::shared_mutex> uniqueLock(lock);

  for (const auto &moment : moments) {
    store.Append(moment);
  }
}

vector<ExperienceMoment> ExperienceMemory::Sample(unsigned numSamples) const {
  return sampleWithDefaultRng(numSamples);
}

vector<ExperienceMoment> ExperienceMemory::Sample(unsigned numSamples, std::mt19937 &rng) const {
  boost::shared_lock<boost::shared_mutex> lock(mutex);
  return SamplingEngine::Sample(store, numSamples, rng);
}

Batch ExperienceMemory::SampleBatch(unsigned numSamples) const {
  return BatchAssembler::Assemble(sampleWithDefaultRng(numSamples));
}

Batch ExperienceMemory::SampleBatch(unsigned numSamples, std::mt19937 &rng) const {
  return BatchAssembler::Assemble(Sample(numSamples, rng));
}

vector<ExperienceMoment> ExperienceMemory::Snapshot(void) const {
  boost::shared_lock<boost::shared_mutex> lock(mutex);

  vector<ExperienceMoment> result;
  result.reserve(store.Size());
  for (unsigned i = 0; i < store.Size(); i++) {
    result.push_back(store.At(i));
  }
  return result;
}

unsigned ExperienceMemory::NumMemories(void) const {
  boost::shared_lock<boost::shared_mutex> lock(mutex);
  return store.Size();
}

unsigned ExperienceMemory::Capacity(void) const {
  // Fixed at construction.
  return store.Capacity();
}

uint64_t ExperienceMemory::TotalAdded(void) const {
  boost::shared_lock<boost::shared_mutex> lock(mutex);
  return store.TotalAppended();
}

bool ExperienceMemory::IsReady(unsigned minSize) const { return NumMemories() >= minSize; }

vector<ExperienceMoment> ExperienceMemory::sampleWithDefaultRng(unsigned numSamples) const {
  if (seeded) {
    std::lock_guard<std::mutex> rngLock(rngMutex);
    return Sample(numSamples, seededRng);
  }
  return Sample(numSamples, threadRng());
}
