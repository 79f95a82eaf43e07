#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: allocator events + counters.
 * @details The default sink prints one line per event; embedders can plug in
 *          their own Observer.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>

#include "vmm/mem/mem_error.hpp"

namespace vmm::obs {

    /** @enum EventKind
     *  @brief Outcome reported by the memory manager.
     */
    enum class EventKind : std::uint8_t {
        Alloc,        ///< alloc() succeeded
        Free,         ///< free() succeeded
        AllocFailed,  ///< alloc() rejected (see error)
        FreeFailed    ///< free() rejected (see error)
    };

    /// @brief Short label for an EventKind ("alloc", "free", ...).
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Cumulative counters for one observer.
     */
    struct Counters {
        uint64_t allocs{0};                 ///< Successful allocations
        uint64_t frees{0};                  ///< Successful frees
        uint64_t alloc_failures{0};         ///< Rejected allocations
        uint64_t free_failures{0};          ///< Rejected frees
        uint64_t exhausted{0};              ///< Failures caused by bookkeeping exhaustion
        uint64_t bytes_allocated_total{0};  ///< Sum of sizes over all successful allocations
    };

    /** @struct AllocEvent
     *  @brief Payload describing a single alloc/free outcome.
     */
    struct AllocEvent {
        EventKind   kind{EventKind::Alloc};
        std::size_t offset{0};                  ///< Block offset (0 on failure)
        std::size_t size{0};                    ///< Requested or released size
        std::optional<vmm::mem::MemError> error; ///< Set for *Failed events
        vmm::mem::FailCause cause{vmm::mem::FailCause::None}; ///< Detail for *Failed events
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single allocator event.
        virtual void record(const AllocEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide printf-backed observer.
    Observer* make_simple_observer();

    /// Fresh observer that only counts (no output).
    std::unique_ptr<Observer> make_counting_observer();

} // namespace vmm::obs
