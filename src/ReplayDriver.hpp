#pragma once

#include "common/Common.hpp"
#include "expreplay/MemorySpec.hpp"

#include <cstdint>
#include <functional>

struct DriverStats {
  uint64_t momentsAdded;
  uint64_t batchesSampled;
  uint64_t inconsistentMoments;
  double elapsedSeconds;
};

using ProgressCallback = function<void(unsigned)>;

// Runs a synthetic producer thread against a consumer thread sampling batches from a shared
// ExperienceMemory.
class ReplayDriver {
public:
  explicit ReplayDriver(const expreplay::MemorySpec &spec);
  ~ReplayDriver();

  void AddProgressCallback(ProgressCallback callback);
  DriverStats Run(unsigned iters);

private:
  struct ReplayDriverImpl;
  uptr<ReplayDriverImpl> impl;
};
