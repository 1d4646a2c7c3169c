#pragma once
#include <cstdint>
#include <stdexcept>

// Monotonic id source. Ids start at 1; 0 is never handed out.
class SequenceAllocator {
public:
  explicit SequenceAllocator(uint64_t next = 1) : next_(next == 0 ? 1 : next) {}

  uint64_t allocate() { return next_++; }

  // Used when rehydrating from storage. Never moves backwards.
  void advance_to(uint64_t next) {
    if (next < next_) throw std::logic_error("sequence cannot move backwards");
    next_ = next;
  }

private:
  uint64_t next_;
};
