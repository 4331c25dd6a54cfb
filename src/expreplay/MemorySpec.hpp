#pragma once

#include "Constants.hpp"
#include "Errors.hpp"

#include <iostream>
#include <limits>
#include <string>

namespace expreplay {

struct MemorySpec {
  unsigned capacity = DEFAULT_MEMORY_CAPACITY;
  unsigned batchSize = DEFAULT_BATCH_SIZE;
  unsigned seed = DEFAULT_SEED;

  void Validate(void) const {
    if (capacity == 0) {
      throw ConfigError("capacity must be positive");
    }
    if (batchSize == 0) {
      throw ConfigError("batch size must be positive");
    }
    if (batchSize > capacity) {
      throw ConfigError("batch size " + std::to_string(batchSize) + " exceeds capacity " +
                        std::to_string(capacity));
    }
  }

  inline void Write(std::ostream &out) const {
    out << capacity << std::endl;
    out << batchSize << std::endl;
    out << seed << std::endl;
  }

  static MemorySpec Read(std::istream &in) {
    MemorySpec spec;
    readField(in, spec.capacity, "capacity");
    readField(in, spec.batchSize, "batchSize");
    readField(in, spec.seed, "seed");
    return spec;
  }

private:
  static void readField(std::istream &in, unsigned &field, const char *name) {
    long long value;
    if (!(in >> value)) {
      throw ConfigError(std::string("missing or malformed field: ") + name);
    }
    if (value < 0 || value > static_cast<long long>(std::numeric_limits<unsigned>::max())) {
      throw ConfigError(std::string("field out of range: ") + name);
    }
    field = static_cast<unsigned>(value);
  }
};
}
