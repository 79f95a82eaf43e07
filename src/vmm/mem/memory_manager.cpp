// =============================================================
// File: src/vmm/mem/memory_manager.cpp
// =============================================================
#include "vmm/mem/memory_manager.hpp"

#include <algorithm>
#include <atomic>
#include <new>
#include <numeric>
#include <optional>
#include <ostream>

namespace vmm::mem {

namespace {

// Token 0 marks an empty handle, so issuing starts at 1.
std::atomic<ManagerToken> g_next_token{1};

bool by_offset(const Block& a, const Block& b) noexcept {
  // Ties on offset put the shorter block first so it can merge forward.
  return a.offset() < b.offset() || (a.offset() == b.offset() && a.end() < b.end());
}

} // namespace

/**
 * @brief Capture the buffer and seed the free list with one block covering it.
 *
 * The buffer is not zeroed; a fresh token identifies handles from this instance.
 */
MemoryManager::MemoryManager(std::span<std::byte> buffer, vmm::obs::Observer* observer)
  : buf_(buffer),
    token_(g_next_token.fetch_add(1, std::memory_order_relaxed)),
    observer_(observer)
{
  free_blocks_.emplace_back(0, buf_.size());
}

vmm_detail::expected<Allocation, MemError> MemoryManager::alloc(std::size_t size) {
  std::optional<Block> chosen;
  AllocationId id = 0;
  FailCause cause = FailCause::None;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (size > buf_.size()) {
      cause = FailCause::ExceedsCapacity;
    } else {
      // First fit in offset order.
      auto it = std::find_if(free_blocks_.begin(), free_blocks_.end(),
                             [size](const Block& b) { return b.size() >= size; });
      if (it == free_blocks_.end()) {
        cause = FailCause::NoContiguousBlock;
      } else {
        const Block taken{it->offset(), it->offset() + size};
        // The table insert is the only step that allocates; it runs before
        // the free list is touched so a throw leaves both collections intact.
        try {
          alloc_blocks_.emplace(next_id_, taken);
        } catch (const std::bad_alloc&) {
          cause = FailCause::ResourceExhausted;
        }
        if (cause == FailCause::None) {
          if (size == 0) {
            // nothing to carve
          } else if (it->size() == size) {
            free_blocks_.erase(it);
          } else {
            *it = Block{taken.end(), it->end()};
          }
          id = next_id_++;
          chosen = taken;
        }
      }
    }
  }

  if (!chosen) {
    report(vmm::obs::EventKind::AllocFailed, 0, size, MemError::OutOfMemory, cause);
    return vmm_detail::unexpected(MemError::OutOfMemory);
  }
  report(vmm::obs::EventKind::Alloc, chosen->offset(), size);
  return Allocation{token_, id, chosen->offset(), buf_.subspan(chosen->offset(), size)};
}

vmm_detail::expected<void, MemError> MemoryManager::free(Allocation& allocation) {
  std::optional<Block> released;
  FailCause cause = FailCause::UnknownHandle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (allocation.valid() && allocation.owner() == token_ &&
        alloc_blocks_.find(allocation.id()) != alloc_blocks_.end()) {
      // Grow the free list up front; past this point nothing throws
      // (std::sort works in place, erase and push_back into reserved
      // capacity do not allocate).
      bool room = true;
      try {
        free_blocks_.reserve(free_blocks_.size() + 1);
      } catch (const std::bad_alloc&) {
        room = false;
        cause = FailCause::ResourceExhausted;
      }
      if (room) {
        auto node = alloc_blocks_.extract(allocation.id());
        released = node.mapped();
        allocation.invalidate();
        // A zero-size block carries no bytes and would only leave a
        // degenerate entry behind.
        if (released->size() != 0) {
          free_blocks_.push_back(*released);
          coalesce_locked();
        }
      }
    }
  }

  if (!released) {
    const MemError err = (cause == FailCause::ResourceExhausted) ? MemError::OutOfMemory
                                                                 : MemError::NotOwned;
    report(vmm::obs::EventKind::FreeFailed, allocation.offset(), allocation.size(), err, cause);
    return vmm_detail::unexpected(err);
  }
  report(vmm::obs::EventKind::Free, released->offset(), released->size());
  return {};
}

// Re-sort, then merge neighbours left to right. After sorting a merge only
// ever needs the immediate successor, so one sweep converges.
void MemoryManager::coalesce_locked() {
  std::sort(free_blocks_.begin(), free_blocks_.end(), by_offset);

  std::size_t i = 0;
  while (i + 1 < free_blocks_.size()) {
    const Block& cur  = free_blocks_[i];
    const Block& next = free_blocks_[i + 1];
    if (cur.adjacent_to(next)) {
      free_blocks_[i] = Block{cur.offset(), next.end()};
      free_blocks_.erase(free_blocks_.begin() + static_cast<std::ptrdiff_t>(i + 1));
    } else {
      ++i;
    }
  }
}

std::size_t MemoryManager::unallocated_locked() const noexcept {
  return std::accumulate(free_blocks_.begin(), free_blocks_.end(), std::size_t{0},
                         [](std::size_t acc, const Block& b) { return acc + b.size(); });
}

std::size_t MemoryManager::available_locked() const noexcept {
  std::size_t best = 0;
  for (const auto& b : free_blocks_) best = std::max(best, b.size());
  return best;
}

std::size_t MemoryManager::allocated_locked() const noexcept {
  std::size_t total = 0;
  for (const auto& kv : alloc_blocks_) total += kv.second.size();
  return total;
}

std::size_t MemoryManager::unallocated() const {
  std::lock_guard<std::mutex> lk(mu_);
  return unallocated_locked();
}

std::size_t MemoryManager::available() const {
  std::lock_guard<std::mutex> lk(mu_);
  return available_locked();
}

std::size_t MemoryManager::allocated() const {
  std::lock_guard<std::mutex> lk(mu_);
  return allocated_locked();
}

std::vector<Block> MemoryManager::free_blocks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return free_blocks_;
}

std::size_t MemoryManager::allocation_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return alloc_blocks_.size();
}

bool MemoryManager::check_invariants() const {
  std::lock_guard<std::mutex> lk(mu_);

  // Free list: in bounds, non-degenerate, strictly ordered, never touching.
  for (std::size_t i = 0; i < free_blocks_.size(); ++i) {
    const Block& b = free_blocks_[i];
    if (b.offset() > b.end() || b.end() > buf_.size()) return false;
    if (b.size() == 0 && !buf_.empty()) return false;
    if (i > 0 && free_blocks_[i - 1].end() >= b.offset()) return false;
  }

  // Allocations: in bounds and disjoint from each other and the free list.
  std::vector<Block> used;
  used.reserve(alloc_blocks_.size());
  for (const auto& kv : alloc_blocks_) {
    if (kv.second.offset() > kv.second.end() || kv.second.end() > buf_.size()) return false;
    if (kv.second.size() != 0) used.push_back(kv.second);
  }
  std::sort(used.begin(), used.end(), by_offset);
  for (std::size_t i = 1; i < used.size(); ++i) {
    if (used[i - 1].overlaps(used[i])) return false;
  }
  for (const auto& u : used) {
    for (const auto& f : free_blocks_) {
      if (u.overlaps(f)) return false;
    }
  }

  return unallocated_locked() + allocated_locked() == buf_.size();
}

std::string MemoryManager::to_string() const {
  std::size_t avail = 0, used = 0, unused = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    avail  = available_locked();
    used   = allocated_locked();
    unused = unallocated_locked();
  }
  return "<MemoryManager(available=" + std::to_string(avail) +
         ", allocated="   + std::to_string(used) +
         ", unallocated=" + std::to_string(unused) + ")>";
}

void MemoryManager::report(vmm::obs::EventKind kind, std::size_t offset, std::size_t size,
                           std::optional<MemError> error, FailCause cause) const {
  if (!observer_) return;
  observer_->record(vmm::obs::AllocEvent{kind, offset, size, error, cause});
}

std::ostream& operator<<(std::ostream& os, const MemoryManager& mm) {
  return os << mm.to_string();
}

} // namespace vmm::mem
