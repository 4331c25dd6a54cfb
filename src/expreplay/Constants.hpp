#pragma once

namespace expreplay {

static constexpr unsigned DEFAULT_MEMORY_CAPACITY = 100000;
static constexpr unsigned DEFAULT_BATCH_SIZE = 200;
static constexpr unsigned DEFAULT_SEED = 0; // 0 draws a seed from std::random_device.
}
