// =============================================================
// File: include/vmm/mem/memory_manager.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "vmm/compat/expected.hpp"  // vmm_detail::expected / unexpected
#include "vmm/mem/allocation.hpp"
#include "vmm/mem/block.hpp"
#include "vmm/mem/mem_error.hpp"
#include "vmm/obs/observability.hpp"

namespace vmm::mem {

/**
 * @file memory_manager.hpp
 * @brief First-fit allocator carving byte ranges out of a caller-owned buffer.
 *
 * Design:
 *  - The buffer is borrowed for the manager's lifetime; its contents are
 *    never zeroed or interpreted.
 *  - Free list: std::vector<Block> kept sorted by offset and maximally
 *    coalesced (no two entries overlap or touch).
 *  - Allocation table: AllocationId -> Block, one entry per live handle.
 *    Ids are issued by the manager; handles also carry the manager's token,
 *    so a handle from another instance never matches this table.
 *  - sum(free) + sum(allocated) == capacity() after every operation.
 *
 * Thread-safety:
 *  - A single mutex guards free list and table; every public operation,
 *    read-only ones included, holds it for its full duration.
 *  - Buffer contents are NOT protected. Disjoint handles may be written
 *    concurrently; using a handle after free() is the caller's bug.
 *  - The observer, when attached, is called after the lock is released.
 */
class MemoryManager {
public:
  /// @brief Manage @p buffer. The free list starts as [0, buffer.size()).
  /// @param observer Optional event sink; must outlive the manager.
  explicit MemoryManager(std::span<std::byte> buffer,
                         vmm::obs::Observer* observer = nullptr);

  MemoryManager(const MemoryManager&)            = delete;
  MemoryManager& operator=(const MemoryManager&) = delete;
  MemoryManager(MemoryManager&&)                 = delete;
  MemoryManager& operator=(MemoryManager&&)      = delete;

  /**
   * @brief Reserve @p size bytes from the first free block large enough.
   *
   * An exact fit consumes the free block; otherwise its low @p size bytes are
   * taken and the block shrinks from below. A zero-size request returns an
   * empty view at the first free block's offset and consumes nothing.
   *
   * @return Live handle, or MemError::OutOfMemory (state unchanged). The
   *         observer event names the cause: request larger than the buffer,
   *         no single block large enough, or std::bad_alloc while growing
   *         the allocation table.
   */
  vmm_detail::expected<Allocation, MemError> alloc(std::size_t size);

  /**
   * @brief Return @p allocation to the free list and invalidate it.
   * @return MemError::NotOwned if the handle was not issued by this manager
   *         or was already freed; MemError::OutOfMemory if the free list
   *         could not grow. State and handle are unchanged on failure.
   */
  vmm_detail::expected<void, MemError> free(Allocation& allocation);

  /// @brief Total free bytes.
  [[nodiscard]] std::size_t unallocated() const;

  /// @brief Largest contiguous free block (0 when nothing is free).
  [[nodiscard]] std::size_t available() const;

  /// @brief Total bytes held by live allocations.
  [[nodiscard]] std::size_t allocated() const;

  /// @brief Size of the managed buffer.
  [[nodiscard]] std::size_t capacity() const noexcept { return buf_.size(); }

  /// @brief Copy of the free list, in offset order.
  [[nodiscard]] std::vector<Block> free_blocks() const;

  /// @brief Number of live allocations.
  [[nodiscard]] std::size_t allocation_count() const;

  /// @brief Verify ordering, coalescing, bounds, overlap and conservation.
  [[nodiscard]] bool check_invariants() const;

  /// @brief "<MemoryManager(available=A, allocated=B, unallocated=C)>"
  [[nodiscard]] std::string to_string() const;

private:
  void coalesce_locked();
  std::size_t unallocated_locked() const noexcept;
  std::size_t available_locked() const noexcept;
  std::size_t allocated_locked() const noexcept;
  void report(vmm::obs::EventKind kind, std::size_t offset, std::size_t size,
              std::optional<MemError> error = std::nullopt,
              FailCause cause = FailCause::None) const;

  std::span<std::byte>                     buf_;
  const ManagerToken                       token_;
  vmm::obs::Observer*                      observer_{nullptr};

  mutable std::mutex                       mu_;            ///< Guards everything below
  std::vector<Block>                       free_blocks_{};
  std::unordered_map<AllocationId, Block>  alloc_blocks_{};
  AllocationId                             next_id_{1};
};

std::ostream& operator<<(std::ostream& os, const MemoryManager& mm);

} // namespace vmm::mem
