#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader for tool configuration: named defaults overlaid by a TOML file.
 *
 * Schema (every key optional):
 * @code
 * [arena]
 * buffer_size = 4096
 *
 * [logging]
 * log_events = false
 *
 * [bench]
 * threads    = 4
 * iterations = 100000
 * min_alloc  = 8
 * max_alloc  = 256
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "vmm/compat/expected.hpp"
#include "vmm/config/constants.hpp"

namespace vmm::config {

    /** @struct VmmConfig
     *  @brief Settings shared by the demo app and the benchmark.
     */
    struct VmmConfig {
        std::size_t buffer_size      = constants::DEFAULT_BUFFER_SIZE;      ///< Arena length in bytes
        bool        log_events       = constants::DEFAULT_LOG_EVENTS;       ///< Print one line per alloc/free
        std::size_t bench_threads    = constants::BENCH_DEFAULT_THREADS;    ///< Churn workers
        std::size_t bench_iterations = constants::BENCH_DEFAULT_ITERATIONS; ///< Attempts per worker
        std::size_t bench_min_alloc  = constants::BENCH_DEFAULT_MIN_ALLOC;  ///< Smallest request
        std::size_t bench_max_alloc  = constants::BENCH_DEFAULT_MAX_ALLOC;  ///< Largest request
    };

    /** @enum ConfigError
     *  @brief Reasons a configuration file is rejected.
     */
    enum class ConfigError : std::uint8_t {
        FileNotFound = 1,  ///< Path could not be opened
        ParseError,        ///< Not valid TOML
        UnknownKey,        ///< Section or key not part of the schema
        InvalidValue       ///< Wrong type or out of range
    };

    /// @brief Human-readable label for a ConfigError.
    const char* to_string(ConfigError e) noexcept;

    /** @class Loader
     *  @brief Source of tool configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /**
         * @brief Load configuration from @p path, or defaults if it is empty.
         * @return Populated VmmConfig or the first error encountered.
         */
        static vmm_detail::expected<VmmConfig, ConfigError> load_from_file(const std::string& path);

        /// @brief Parse TOML configuration text.
        static vmm_detail::expected<VmmConfig, ConfigError> parse(const std::string& text);
    };

} // namespace vmm::config
