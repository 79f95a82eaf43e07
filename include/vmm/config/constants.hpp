#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the memory manager tools.
 * @details Override via the config Loader (key = value files).
 */

#include <cstddef>
#include <cstdint>

namespace vmm::config::constants {

// =====================
// Arena
// =====================
inline constexpr std::size_t DEFAULT_BUFFER_SIZE = 4096;  ///< Bytes handed to the demo/bench manager

// =====================
// Logging
// =====================
inline constexpr bool DEFAULT_LOG_EVENTS = false;  ///< Attach the printf observer

// =====================
// Allocation churn benchmark
// =====================
inline constexpr std::size_t BENCH_DEFAULT_THREADS    = 4;       ///< Worker threads sharing one manager
inline constexpr std::size_t BENCH_DEFAULT_ITERATIONS = 100000;  ///< alloc/free attempts per thread
inline constexpr std::size_t BENCH_DEFAULT_MIN_ALLOC  = 8;       ///< Smallest request (bytes)
inline constexpr std::size_t BENCH_DEFAULT_MAX_ALLOC  = 256;     ///< Largest request (bytes)
inline constexpr std::size_t BENCH_MAX_LIVE_PER_THREAD = 32;     ///< Handles a worker holds before freeing
inline constexpr std::uint64_t BENCH_DEFAULT_SEED = 0xA11C0C8EULL; ///< Deterministic RNG salt

} // namespace vmm::config::constants
