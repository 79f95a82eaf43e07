// =============================================================
// File: src/vmm/mem/block.cpp
// =============================================================
#include "vmm/mem/block.hpp"

#include <ostream>

namespace vmm::mem {

std::string to_string(const Block& b) {
  return "<Block(offset=" + std::to_string(b.offset()) +
         ", end="         + std::to_string(b.end()) +
         ", size="        + std::to_string(b.size()) + ")>";
}

std::ostream& operator<<(std::ostream& os, const Block& b) {
  return os << to_string(b);
}

} // namespace vmm::mem
