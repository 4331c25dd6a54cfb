#pragma once

#include "../common/Common.hpp"
#include "ExperienceMoment.hpp"

#include <cstdint>

namespace expreplay {

enum class FillState { EMPTY, FILLING, FULL };

// Fixed-capacity circular storage. All slots are allocated at construction; once the store is
// full every append overwrites the oldest live entry. Not thread-safe.
class RingStore {
  vector<ExperienceMoment> slots;
  unsigned writeCursor;
  unsigned occupancy;
  uint64_t totalAppended;

public:
  // Throws ConstructionError unless 0 < capacity <= UINT_MAX.
  explicit RingStore(long long capacity);
  ~RingStore() = default;

  // Copies keep the source's capacity. There is no move constructor, so a moved-from store is
  // copied and left intact, and no assignment, so a store is never resized after construction.
  RingStore(const RingStore &other) = default;
  RingStore &operator=(const RingStore &other) = delete;

  void Append(const ExperienceMoment &moment);
  void Append(ExperienceMoment &&moment);

  // Physical slot access, throws IndexOutOfRange for an unwritten or out of range slot.
  const ExperienceMoment &Get(unsigned physicalSlot) const;

  // Logical index 0 is the oldest live entry, Size() - 1 the most recent.
  unsigned PhysicalSlot(unsigned logicalIndex) const;
  const ExperienceMoment &At(unsigned logicalIndex) const;

  unsigned Size(void) const { return occupancy; }
  unsigned Capacity(void) const { return static_cast<unsigned>(slots.size()); }
  unsigned WriteCursor(void) const { return writeCursor; }
  uint64_t TotalAppended(void) const { return totalAppended; }
  FillState State(void) const;

private:
  void advance(void);
};
}
