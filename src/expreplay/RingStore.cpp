#include "RingStore.hpp"
#include "Errors.hpp"

#include <cassert>
#include <limits>
#include <string>

using namespace expreplay;

RingStore::RingStore(long long capacity) : writeCursor(0), occupancy(0), totalAppended(0) {
  if (capacity <= 0) {
    throw ConstructionError("ring store capacity must be positive, got " +
                            std::to_string(capacity));
  }
  if (capacity > static_cast<long long>(std::numeric_limits<unsigned>::max())) {
    throw ConstructionError("ring store capacity too large: " + std::to_string(capacity));
  }
  slots.resize(static_cast<unsigned>(capacity));
}

void RingStore::Append(const ExperienceMoment &moment) {
  slots[writeCursor] = moment;
  advance();
}

void RingStore::Append(ExperienceMoment &&moment) {
  slots[writeCursor] = std::move(moment);
  advance();
}

const ExperienceMoment &RingStore::Get(unsigned physicalSlot) const {
  // Slots [0, occupancy) are exactly the ones written so far, before and after wrap-around.
  if (physicalSlot >= occupancy) {
    throw IndexOutOfRange("slot " + std::to_string(physicalSlot) + " is not filled (size " +
                          std::to_string(occupancy) + ", capacity " +
                          std::to_string(slots.size()) + ")");
  }
  return slots[physicalSlot];
}

unsigned RingStore::PhysicalSlot(unsigned logicalIndex) const {
  if (logicalIndex >= occupancy) {
    throw IndexOutOfRange("logical index " + std::to_string(logicalIndex) +
                          " outside live window of " + std::to_string(occupancy));
  }

  if (occupancy < slots.size()) {
    return logicalIndex;
  }
  return (writeCursor + logicalIndex) % slots.size();
}

const ExperienceMoment &RingStore::At(unsigned logicalIndex) const {
  return slots[PhysicalSlot(logicalIndex)];
}

FillState RingStore::State(void) const {
  if (occupancy == 0) {
    return FillState::EMPTY;
  }
  return occupancy < slots.size() ? FillState::FILLING : FillState::FULL;
}

void RingStore::advance(void) {
  writeCursor = (writeCursor + 1) % slots.size();
  if (occupancy < slots.size()) {
    occupancy++;
  }
  totalAppended++;

  assert(occupancy <= slots.size());
}
