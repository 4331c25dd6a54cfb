#include "ReplayDriver.hpp"
#include "common/Common.hpp"
#include "expreplay/Errors.hpp"
#include "expreplay/MemorySpec.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace expreplay;

static constexpr unsigned NUM_ITERS = 20000;

int main(int argc, char **argv) {
  MemorySpec spec;

  try {
    if (argc > 1) {
      std::ifstream specFile(argv[1]);
      if (!specFile) {
        std::cerr << "could not open spec file: " << argv[1] << std::endl;
        return EXIT_FAILURE;
      }
      spec = MemorySpec::Read(specFile);
    }
    spec.Validate();
  } catch (const ConfigError &e) {
    std::cerr << "invalid memory spec: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  std::cout << "memory spec:" << std::endl;
  spec.Write(std::cout);

  ReplayDriver driver(spec);
  driver.AddProgressCallback(
      [](unsigned iter) { std::cout << "sampled batches: " << iter << std::endl; });

  DriverStats stats = driver.Run(NUM_ITERS);

  std::cout << "moments added: " << stats.momentsAdded << std::endl;
  std::cout << "batches sampled: " << stats.batchesSampled << std::endl;
  std::cout << "adds per second: " << (stats.momentsAdded / stats.elapsedSeconds) << std::endl;
  std::cout << "samples per second: " << (stats.batchesSampled / stats.elapsedSeconds)
            << std::endl;

  if (stats.inconsistentMoments > 0) {
    std::cerr << "torn moments observed: " << stats.inconsistentMoments << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
