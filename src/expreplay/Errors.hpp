#pragma once

#include <stdexcept>
#include <string>

namespace expreplay {

class ReplayError : public std::runtime_error {
public:
  explicit ReplayError(const std::string &what) : std::runtime_error(what) {}
};

// Capacity was zero.
class ConstructionError : public ReplayError {
public:
  explicit ConstructionError(const std::string &what) : ReplayError(what) {}
};

// A sample of k entries was requested with k == 0 or k greater than the number of live entries.
class InsufficientSamples : public ReplayError {
public:
  explicit InsufficientSamples(const std::string &what) : ReplayError(what) {}
};

// A physical slot or logical index outside the written range.
class IndexOutOfRange : public ReplayError {
public:
  explicit IndexOutOfRange(const std::string &what) : ReplayError(what) {}
};

class EmptyBatch : public ReplayError {
public:
  explicit EmptyBatch(const std::string &what) : ReplayError(what) {}
};

// Malformed or inconsistent MemorySpec.
class ConfigError : public ReplayError {
public:
  explicit ConfigError(const std::string &what) : ReplayError(what) {}
};
}
