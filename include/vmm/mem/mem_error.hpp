#pragma once

#include <cstdint>

namespace vmm::mem {

/**
 * @brief Error codes reported by MemoryManager and Allocation.
 * Failure paths never mutate manager state.
 */
enum class MemError : std::uint8_t {
  OutOfMemory = 1,   ///< Request exceeds capacity or no free block is large enough
  NotOwned,          ///< Handle unknown to this manager (foreign, freed, or moved-from)
  InvalidHandle,     ///< Access through a handle that has been freed
  OutOfBounds        ///< Access outside the handle's byte range
};

/// @brief Human-readable label for a MemError.
[[nodiscard]] constexpr const char* to_string(MemError e) noexcept {
  switch (e) {
    case MemError::OutOfMemory:   return "out of memory";
    case MemError::NotOwned:      return "allocation not owned by this memory manager";
    case MemError::InvalidHandle: return "allocation handle has been released";
    case MemError::OutOfBounds:   return "access outside allocation bounds";
  }
  return "unknown";
}

/**
 * @brief Why an operation failed; several causes share one MemError.
 */
enum class FailCause : std::uint8_t {
  None = 0,            ///< Operation succeeded
  ExceedsCapacity,     ///< Request larger than the whole buffer
  NoContiguousBlock,   ///< Enough bytes may be free, but no single block fits
  UnknownHandle,       ///< Handle not in this manager's table
  ResourceExhausted    ///< Bookkeeping could not grow (std::bad_alloc)
};

/// @brief Human-readable label for a FailCause.
[[nodiscard]] constexpr const char* to_string(FailCause c) noexcept {
  switch (c) {
    case FailCause::None:              return "";
    case FailCause::ExceedsCapacity:   return "size is greater than the buffer size";
    case FailCause::NoContiguousBlock: return "not enough contiguous memory";
    case FailCause::UnknownHandle:     return "handle not tracked by this manager";
    case FailCause::ResourceExhausted: return "allocator bookkeeping exhausted";
  }
  return "unknown";
}

} // namespace vmm::mem
