// Tests for SamplingEngine: distinctness, error handling, uniformity of the selected subsets.

#include "expreplay/Errors.hpp"
#include "expreplay/RingStore.hpp"
#include "expreplay/SamplingEngine.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <random>
#include <set>
#include <utility>
#include <vector>

using namespace expreplay;

static ExperienceMoment make_moment(float id) {
  return ExperienceMoment(EVector::Constant(3, id), 0u, id, EVector::Constant(3, id + 1.0f),
                          false);
}

static RingStore make_store(unsigned capacity, unsigned appended) {
  RingStore store(capacity);
  for (unsigned i = 0; i < appended; ++i) {
    store.Append(make_moment(static_cast<float>(i)));
  }
  return store;
}

static bool test_indices_distinct_and_in_range() {
  std::cout << "=== Test: indices are distinct and within [0, size) ===" << std::endl;
  std::mt19937 rng(1234);
  const unsigned sizes[] = {1, 2, 7, 64, 1000};
  for (unsigned size : sizes) {
    for (unsigned k = 1; k <= size; k += (size / 8) + 1) {
      for (int trial = 0; trial < 20; ++trial) {
        std::vector<unsigned> indices = SamplingEngine::SampleIndices(size, k, rng);
        std::set<unsigned> unique(indices.begin(), indices.end());
        if (indices.size() != k || unique.size() != k || *unique.rbegin() >= size) {
          std::cout << "  FAIL: size=" << size << " k=" << k << std::endl;
          return false;
        }
      }
    }
    // k == size must return a permutation of the whole range.
    std::vector<unsigned> all = SamplingEngine::SampleIndices(size, size, rng);
    if (std::set<unsigned>(all.begin(), all.end()).size() != size) {
      std::cout << "  FAIL: k == size is not a permutation (size " << size << ")" << std::endl;
      return false;
    }
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

static bool test_invalid_k_rejected_without_side_effects() {
  std::cout << "=== Test: k == 0 and k > size raise InsufficientSamples ===" << std::endl;
  std::mt19937 rng(99);
  RingStore store = make_store(10, 4);

  int rejected = 0;
  const unsigned bad_ks[] = {0, 5, 10, 11};
  for (unsigned k : bad_ks) {
    try {
      SamplingEngine::Sample(store, k, rng);
    } catch (const InsufficientSamples &) {
      rejected++;
    }
  }
  try {
    RingStore empty(3);
    SamplingEngine::Sample(empty, 1, rng);
  } catch (const InsufficientSamples &) {
    rejected++;
  }

  if (rejected != 5) {
    std::cout << "  FAIL: only " << rejected << " of 5 rejected" << std::endl;
    return false;
  }
  if (store.Size() != 4 || store.WriteCursor() != 4 || store.TotalAppended() != 4) {
    std::cout << "  FAIL: store changed by a failed sample" << std::endl;
    return false;
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

static bool test_samples_only_live_entries() {
  std::cout << "=== Test: evicted entries are never sampled ===" << std::endl;
  std::mt19937 rng(7);
  RingStore store = make_store(16, 100);

  for (int trial = 0; trial < 500; ++trial) {
    for (const auto &moment : SamplingEngine::Sample(store, 16, rng)) {
      if (moment.reward < 84.0f || moment.reward > 99.0f) {
        std::cout << "  FAIL: sampled evicted entry " << moment.reward << std::endl;
        return false;
      }
    }
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

static bool test_capacity_three_scenario() {
  std::cout << "=== Test: capacity 3 after A B C D samples exactly {B, C, D} ===" << std::endl;
  std::mt19937 rng(2024);
  RingStore store = make_store(3, 4);

  for (int trial = 0; trial < 50; ++trial) {
    std::set<float> drawn;
    for (const auto &moment : SamplingEngine::Sample(store, 3, rng)) {
      drawn.insert(moment.reward);
    }
    if (drawn != std::set<float>{1.0f, 2.0f, 3.0f}) {
      std::cout << "  FAIL: drawn set differs from {B, C, D}" << std::endl;
      return false;
    }
  }

  try {
    SamplingEngine::Sample(store, 4, rng);
  } catch (const InsufficientSamples &) {
    std::cout << "  PASS" << std::endl;
    return true;
  }
  std::cout << "  FAIL: sample(4) succeeded" << std::endl;
  return false;
}

static bool test_per_index_frequency_uniform() {
  std::cout << "=== Test: per-index selection frequency converges to k / size ===" << std::endl;
  std::mt19937 rng(42);
  const unsigned size = 10;
  const unsigned k = 3;
  const int trials = 100000;
  RingStore store = make_store(32, size);

  std::vector<int> counts(size, 0);
  for (int t = 0; t < trials; ++t) {
    for (const auto &moment : SamplingEngine::Sample(store, k, rng)) {
      counts[static_cast<unsigned>(moment.reward)]++;
    }
  }

  const double expected = static_cast<double>(k) / size;
  for (unsigned i = 0; i < size; ++i) {
    double freq = static_cast<double>(counts[i]) / trials;
    if (std::fabs(freq - expected) > 0.01) {
      std::cout << "  FAIL: index " << i << " frequency " << freq << ", expected " << expected
                << std::endl;
      return false;
    }
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

static bool test_subset_frequency_uniform() {
  std::cout << "=== Test: every k-subset is equally likely ===" << std::endl;
  std::mt19937 rng(5);
  const unsigned size = 5;
  const unsigned k = 2;
  const int trials = 50000;

  std::map<std::pair<unsigned, unsigned>, int> counts;
  for (int t = 0; t < trials; ++t) {
    std::vector<unsigned> indices = SamplingEngine::SampleIndices(size, k, rng);
    unsigned a = std::min(indices[0], indices[1]);
    unsigned b = std::max(indices[0], indices[1]);
    counts[std::make_pair(a, b)]++;
  }

  // C(5, 2) = 10 subsets, each with probability 0.1.
  if (counts.size() != 10) {
    std::cout << "  FAIL: only " << counts.size() << " subsets observed" << std::endl;
    return false;
  }
  for (const auto &entry : counts) {
    double freq = static_cast<double>(entry.second) / trials;
    if (std::fabs(freq - 0.1) > 0.01) {
      std::cout << "  FAIL: subset {" << entry.first.first << ", " << entry.first.second
                << "} frequency " << freq << std::endl;
      return false;
    }
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

static bool test_large_capacity_small_window() {
  std::cout << "=== Test: sampling a small window of a large store ===" << std::endl;
  std::mt19937 rng(3);
  RingStore store = make_store(100000, 5);

  for (int trial = 0; trial < 100; ++trial) {
    std::vector<ExperienceMoment> moments = SamplingEngine::Sample(store, 5, rng);
    std::set<float> drawn;
    for (const auto &moment : moments) {
      drawn.insert(moment.reward);
    }
    if (drawn.size() != 5 || *drawn.rbegin() > 4.0f) {
      std::cout << "  FAIL: drew outside the live window" << std::endl;
      return false;
    }
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

static bool test_same_seed_same_sample() {
  std::cout << "=== Test: identical generator state gives identical samples ===" << std::endl;
  std::mt19937 a(77);
  std::mt19937 b(77);
  for (int trial = 0; trial < 100; ++trial) {
    if (SamplingEngine::SampleIndices(1000, 32, a) != SamplingEngine::SampleIndices(1000, 32, b)) {
      std::cout << "  FAIL: samples diverged on trial " << trial << std::endl;
      return false;
    }
  }
  std::cout << "  PASS" << std::endl;
  return true;
}

int main() {
  std::cout << "==========================================" << std::endl;
  std::cout << "SamplingEngine Tests" << std::endl;
  std::cout << "==========================================" << std::endl;

  int passed = 0;
  int failed = 0;

  auto run = [&](bool (*test)()) {
    try {
      if (test()) { passed++; } else { failed++; }
    } catch (const std::exception &e) {
      std::cout << "  EXCEPTION: " << e.what() << std::endl;
      failed++;
    }
  };

  run(test_indices_distinct_and_in_range);
  run(test_invalid_k_rejected_without_side_effects);
  run(test_samples_only_live_entries);
  run(test_capacity_three_scenario);
  run(test_per_index_frequency_uniform);
  run(test_subset_frequency_uniform);
  run(test_large_capacity_small_window);
  run(test_same_seed_same_sample);

  std::cout << std::endl << "Passed: " << passed << ", Failed: " << failed << std::endl;
  return failed == 0 ? 0 : 1;
}
