// =============================================================
// File: src/vmm/mem/allocation.cpp
// =============================================================
#include "vmm/mem/allocation.hpp"

#include <algorithm>

namespace vmm::mem {

vmm_detail::expected<void, MemError>
Allocation::check_range(std::size_t pos, std::size_t len) const noexcept {
  if (!valid()) {
    return vmm_detail::unexpected(MemError::InvalidHandle);
  }
  // pos + len may overflow; compare against the remainder instead.
  if (pos > bytes_.size() || len > bytes_.size() - pos) {
    return vmm_detail::unexpected(MemError::OutOfBounds);
  }
  return {};
}

vmm_detail::expected<void, MemError>
Allocation::write(std::size_t pos, std::span<const std::byte> src) noexcept {
  auto ok = check_range(pos, src.size());
  if (!ok) return ok;
  std::copy(src.begin(), src.end(), bytes_.begin() + static_cast<std::ptrdiff_t>(pos));
  return {};
}

vmm_detail::expected<void, MemError>
Allocation::read(std::size_t pos, std::span<std::byte> dst) const noexcept {
  auto ok = check_range(pos, dst.size());
  if (!ok) return ok;
  const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(pos);
  std::copy(first, first + static_cast<std::ptrdiff_t>(dst.size()), dst.begin());
  return {};
}

void Allocation::invalidate() noexcept {
  owner_  = 0;
  id_     = 0;
  offset_ = 0;
  bytes_  = {};
}

void Allocation::move_from(Allocation& other) noexcept {
  owner_  = other.owner_;
  id_     = other.id_;
  offset_ = other.offset_;
  bytes_  = other.bytes_;
  other.invalidate();
}

} // namespace vmm::mem
