// =============================================================
// File: include/vmm/mem/allocation.hpp
// =============================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "vmm/compat/expected.hpp"  // vmm_detail::expected / unexpected
#include "vmm/mem/mem_error.hpp"

namespace vmm::mem {

/// @brief Identity of a live allocation inside one manager's table (0 = none).
using AllocationId = std::uint64_t;

/// @brief Identity of a MemoryManager instance (0 = none).
using ManagerToken = std::uint64_t;

class MemoryManager;

/**
 * @file allocation.hpp
 * @brief Move-only handle to one live allocation.
 *
 * The handle is a view over the manager's backing buffer: writes through
 * bytes() or write() land directly in the buffer. It carries the issuing
 * manager's token and its own AllocationId, which is what the manager keys
 * its table on; two allocations with identical contents remain distinct.
 *
 * MemoryManager::free() invalidates the handle. Afterwards bytes() is empty,
 * read()/write() fail with MemError::InvalidHandle and a second free() is
 * rejected. Moving a handle leaves the source in the same invalidated state.
 */
class Allocation {
public:
  /// @brief Empty, never-valid handle.
  Allocation() noexcept = default;

  Allocation(const Allocation&)            = delete;
  Allocation& operator=(const Allocation&) = delete;

  Allocation(Allocation&& other) noexcept { move_from(other); }

  Allocation& operator=(Allocation&& other) noexcept {
    if (this != &other) move_from(other);
    return *this;
  }

  /// @brief True until the handle is freed or moved from.
  [[nodiscard]] bool valid() const noexcept { return id_ != 0; }

  [[nodiscard]] AllocationId id()     const noexcept { return id_; }
  [[nodiscard]] ManagerToken owner()  const noexcept { return owner_; }
  [[nodiscard]] std::size_t  offset() const noexcept { return offset_; }
  [[nodiscard]] std::size_t  size()   const noexcept { return bytes_.size(); }

  /// @brief Direct view over the allocated bytes (empty once invalidated).
  [[nodiscard]] std::span<std::byte>       bytes()       noexcept { return bytes_; }
  [[nodiscard]] std::span<const std::byte> bytes() const noexcept { return bytes_; }

  /// @brief Copy @p src into the allocation starting at @p pos.
  /// @return InvalidHandle if freed, OutOfBounds if [pos, pos+src.size()) exceeds size().
  vmm_detail::expected<void, MemError>
  write(std::size_t pos, std::span<const std::byte> src) noexcept;

  /// @brief Copy dst.size() bytes starting at @p pos into @p dst.
  vmm_detail::expected<void, MemError>
  read(std::size_t pos, std::span<std::byte> dst) const noexcept;

private:
  friend class MemoryManager;

  Allocation(ManagerToken owner, AllocationId id, std::size_t offset,
             std::span<std::byte> bytes) noexcept
    : owner_(owner), id_(id), offset_(offset), bytes_(bytes) {}

  vmm_detail::expected<void, MemError>
  check_range(std::size_t pos, std::size_t len) const noexcept;

  void invalidate() noexcept;
  void move_from(Allocation& other) noexcept;

  ManagerToken         owner_{0};
  AllocationId         id_{0};
  std::size_t          offset_{0};
  std::span<std::byte> bytes_{};
};

} // namespace vmm::mem
