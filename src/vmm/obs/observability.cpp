/**
 * @file observability.cpp
 * @brief printf-backed and counting implementations of Observer.
 */
#include "vmm/obs/observability.hpp"
#include <mutex>
#include <cstdio>

namespace vmm::obs {

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Alloc:       return "alloc";
            case EventKind::Free:        return "free";
            case EventKind::AllocFailed: return "alloc_failed";
            case EventKind::FreeFailed:  return "free_failed";
        }
        return "unknown";
    }

    class CountingObserver : public Observer {
    public:
        void record(const AllocEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(e);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    protected:
        void count(const AllocEvent& e) {
            switch (e.kind) {
                case EventKind::Alloc:
                    ctr_.allocs++;
                    ctr_.bytes_allocated_total += e.size;
                    break;
                case EventKind::Free:        ctr_.frees++;          break;
                case EventKind::AllocFailed: ctr_.alloc_failures++; break;
                case EventKind::FreeFailed:  ctr_.free_failures++;  break;
            }
            if (e.cause == vmm::mem::FailCause::ResourceExhausted) ctr_.exhausted++;
        }
        mutable std::mutex mu_;
        Counters ctr_;
    };

    class SimpleObserver : public CountingObserver {
    public:
        void record(const AllocEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            count(e);
            // JSON-ish line (swap for structured logger later)
            std::printf(
              R"({"event":"%s","offset":%zu,"size":%zu,"error":"%s","cause":"%s"})" "\n",
              to_string(e.kind), e.offset, e.size,
              e.error ? vmm::mem::to_string(*e.error) : "",
              vmm::mem::to_string(e.cause));
            std::fflush(stdout);
        }
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

    std::unique_ptr<Observer> make_counting_observer() {
        return std::make_unique<CountingObserver>();
    }

} // namespace vmm::obs
