#include "ReplayDriver.hpp"
#include "common/Common.hpp"
#include "common/Timer.hpp"
#include "expreplay/BatchAssembler.hpp"
#include "expreplay/ExperienceMemory.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <thread>

using namespace expreplay;

static constexpr unsigned STATE_SIZE = 8;
static constexpr unsigned NUM_ACTIONS = 4;
static constexpr unsigned EPISODE_LENGTH = 50;
static constexpr unsigned PROGRESS_INTERVAL = 1000;

// Produces transitions whose fields are all derived from one step counter, so a consumer can
// tell if a sampled moment mixes fields from two different appends.
struct SyntheticEnvironment {
  std::mt19937 rng;
  uint64_t step = 0;

  explicit SyntheticEnvironment(unsigned seed) : rng(seed) {}

  ExperienceMoment NextMoment(void) {
    std::uniform_int_distribution<unsigned> actionDist(0, NUM_ACTIONS - 1);

    float t = static_cast<float>(step % (1u << 20));
    EVector state = EVector::Constant(STATE_SIZE, t);
    EVector nextState = EVector::Constant(STATE_SIZE, t + 1.0f);
    bool done = (step % EPISODE_LENGTH) == EPISODE_LENGTH - 1;
    step++;

    return ExperienceMoment(state, actionDist(rng), t, nextState, done);
  }
};

static bool isConsistent(const Batch &batch, unsigned i) {
  float t = batch.rewards(i);
  return (batch.states[i].array() == t).all() && (batch.nextStates[i].array() == t + 1.0f).all();
}

struct ReplayDriver::ReplayDriverImpl {
  MemorySpec spec;
  vector<ProgressCallback> callbacks;
  std::atomic<unsigned> numLearnIters;

  explicit ReplayDriverImpl(const MemorySpec &spec) : spec(spec), numLearnIters(0) {
    spec.Validate();
  }

  void AddProgressCallback(ProgressCallback callback) { callbacks.push_back(callback); }

  DriverStats Run(unsigned iters) {
    auto memory = make_unique<ExperienceMemory>(spec);

    std::atomic<uint64_t> momentsAdded(0);
    std::atomic<uint64_t> inconsistent(0);
    numLearnIters = 0;

    Timer timer;
    timer.Start();

    std::thread playoutThread([this, iters, &memory, &momentsAdded]() {
      SyntheticEnvironment env(spec.seed != 0 ? spec.seed : std::random_device{}());
      while (numLearnIters.load() < iters) {
        memory->AddExperience(env.NextMoment());
        momentsAdded++;
      }
    });

    std::thread learnThread([this, iters, &memory, &inconsistent]() {
      while (!memory->IsReady(std::min(2 * spec.batchSize, spec.capacity))) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }

      for (unsigned i = 0; i < iters; i++) {
        Batch batch = memory->SampleBatch(spec.batchSize);
        for (unsigned j = 0; j < batch.Size(); j++) {
          if (!isConsistent(batch, j)) {
            inconsistent++;
          }
        }

        this->numLearnIters++;
        if ((i + 1) % PROGRESS_INTERVAL == 0) {
          for (auto &callback : callbacks) {
            callback(i + 1);
          }
        }
      }
    });

    playoutThread.join();
    learnThread.join();
    timer.Stop();

    DriverStats stats;
    stats.momentsAdded = momentsAdded.load();
    stats.batchesSampled = numLearnIters.load();
    stats.inconsistentMoments = inconsistent.load();
    stats.elapsedSeconds = timer.GetNumElapsedSeconds();
    return stats;
  }
};

ReplayDriver::ReplayDriver(const MemorySpec &spec) : impl(new ReplayDriverImpl(spec)) {}
ReplayDriver::~ReplayDriver() = default;

void ReplayDriver::AddProgressCallback(ProgressCallback callback) {
  impl->AddProgressCallback(callback);
}

DriverStats ReplayDriver::Run(unsigned iters) { return impl->Run(iters); }
