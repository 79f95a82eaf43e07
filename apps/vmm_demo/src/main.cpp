/**
 * @file main.cpp
 * @brief vmm_demo: walks a MemoryManager through allocation, exhaustion,
 *        fragmentation and coalescing, printing its state after each step.
 *
 * Usage:
 *   ./vmm_demo [config_file]
 *
 * The first walkthrough always uses a 255-byte arena; the second uses
 * buffer_size from the config (default 4096). With log_events = true every
 * alloc/free is also printed by the observer.
 */

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

#include "vmm/config/config_loader.hpp"
#include "vmm/mem/buffer.hpp"
#include "vmm/mem/memory_manager.hpp"
#include "vmm/obs/observability.hpp"
#include "vmm/version.hpp"

using vmm::mem::Allocation;
using vmm::mem::MemoryManager;

static void print_state(const char* step, const MemoryManager& mm) {
    std::cout << "  " << step << "\n    " << mm << "\n";
    for (const auto& b : mm.free_blocks()) {
        std::cout << "    free " << b << "\n";
    }
}

static int walkthrough_exhaustion(vmm::obs::Observer* obs) {
    std::cout << "[1] first fit and exhaustion (255 bytes)\n";
    auto buf = vmm::mem::create_buffer(255);
    MemoryManager mm(buf, obs);
    print_state("initial", mm);

    auto a = mm.alloc(100);
    auto b = mm.alloc(100);
    if (!a || !b) {
        std::cerr << "unexpected allocation failure\n";
        return 1;
    }
    print_state("after 2 x alloc(100)", mm);

    auto c = mm.alloc(100);
    std::cout << "  alloc(100) -> "
              << (c ? "ok" : vmm::mem::to_string(c.error())) << "\n";

    if (!mm.free(*a)) return 1;
    print_state("after freeing the first allocation", mm);
    if (!mm.free(*b)) return 1;
    print_state("after freeing the second allocation", mm);
    return 0;
}

static int walkthrough_coalescing(std::size_t buffer_size, vmm::obs::Observer* obs) {
    std::cout << "[2] fragmentation and coalescing (" << buffer_size << " bytes)\n";
    auto buf = vmm::mem::create_buffer(buffer_size);
    MemoryManager mm(buf, obs);

    const std::size_t chunk = buffer_size / 16 > 0 ? buffer_size / 16 : 1;
    std::vector<Allocation> live;
    for (int i = 0; i < 5; ++i) {
        auto r = mm.alloc(chunk);
        if (!r) {
            std::cerr << "alloc(" << chunk << ") failed: " << vmm::mem::to_string(r.error()) << "\n";
            return 1;
        }
        live.push_back(std::move(*r));
    }
    print_state("after 5 allocations", mm);

    // Free out of order: 2, 4, 5, 1, 3.
    for (std::size_t idx : {1u, 3u, 4u, 0u, 2u}) {
        if (auto r = mm.free(live[idx]); !r) {
            std::cerr << "free failed: " << vmm::mem::to_string(r.error()) << "\n";
            return 1;
        }
        const std::string step = "after freeing allocation #" + std::to_string(idx + 1);
        print_state(step.c_str(), mm);
    }

    std::cout << "  invariants " << (mm.check_invariants() ? "hold" : "VIOLATED") << "\n";
    return mm.check_invariants() ? 0 : 1;
}

int main(int argc, char** argv) {
    const std::string path = (argc > 1) ? argv[1] : "";
    auto cfg = vmm::config::Loader::load_from_file(path);
    if (!cfg) {
        std::fprintf(stderr, "vmm_demo: %s (%s)\n", vmm::config::to_string(cfg.error()), path.c_str());
        return 2;
    }

    std::cout << "vmm_demo " << vmm::version_string << "\n"
              << "--------------------------------------------------\n";

    vmm::obs::Observer* obs = cfg->log_events ? vmm::obs::make_simple_observer() : nullptr;

    if (int rc = walkthrough_exhaustion(obs); rc != 0) return rc;
    if (int rc = walkthrough_coalescing(cfg->buffer_size, obs); rc != 0) return rc;

    std::cout << std::flush;
    return 0;
}
