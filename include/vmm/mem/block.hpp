// =============================================================
// File: include/vmm/mem/block.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>

namespace vmm::mem {

/**
 * @file block.hpp
 * @brief Half-open byte range [offset, end) inside a managed buffer.
 *
 * Blocks describe both free and allocated regions. They are values: a range
 * that changes is replaced by a new Block, never edited in place.
 */
class Block {
public:
  constexpr Block() noexcept = default;

  /// @pre offset <= end
  constexpr Block(std::size_t offset, std::size_t end) noexcept
    : offset_(offset), end_(end) {}

  constexpr std::size_t offset() const noexcept { return offset_; }
  constexpr std::size_t end()    const noexcept { return end_; }
  constexpr std::size_t size()   const noexcept { return end_ - offset_; }

  /// @brief True if @p next starts exactly where this block ends.
  constexpr bool adjacent_to(const Block& next) const noexcept {
    return end_ == next.offset_;
  }

  /// @brief True if the two ranges share at least one byte.
  constexpr bool overlaps(const Block& other) const noexcept {
    return offset_ < other.end_ && other.offset_ < end_;
  }

  friend constexpr bool operator==(const Block&, const Block&) noexcept = default;

private:
  std::size_t offset_{0};
  std::size_t end_{0};
};

/// @brief "<Block(offset=0, end=100, size=100)>"
std::string to_string(const Block& b);

std::ostream& operator<<(std::ostream& os, const Block& b);

} // namespace vmm::mem
