/**
 * @file config_loader.cpp
 * @brief TOML loader (toml++) over named defaults.
 */
#include "vmm/config/config_loader.hpp"

#include <cstdint>
#include <filesystem>
#include <string_view>

#include <toml++/toml.hpp>

namespace vmm::config {

    namespace {

        bool read_size(const toml::node& n, std::size_t& out) noexcept {
            const auto* v = n.as_integer();
            if (!v || v->get() < 0) return false;
            out = static_cast<std::size_t>(v->get());
            return true;
        }

        bool read_bool(const toml::node& n, bool& out) noexcept {
            const auto* v = n.as_boolean();
            if (!v) return false;
            out = v->get();
            return true;
        }

        vmm_detail::expected<void, ConfigError>
        apply(VmmConfig& cfg, std::string_view section, std::string_view key, const toml::node& value) {
            bool ok = false;
            if (section == "arena" && key == "buffer_size")      ok = read_size(value, cfg.buffer_size);
            else if (section == "logging" && key == "log_events") ok = read_bool(value, cfg.log_events);
            else if (section == "bench" && key == "threads")      ok = read_size(value, cfg.bench_threads);
            else if (section == "bench" && key == "iterations")   ok = read_size(value, cfg.bench_iterations);
            else if (section == "bench" && key == "min_alloc")    ok = read_size(value, cfg.bench_min_alloc);
            else if (section == "bench" && key == "max_alloc")    ok = read_size(value, cfg.bench_max_alloc);
            else return vmm_detail::unexpected(ConfigError::UnknownKey);

            if (!ok) return vmm_detail::unexpected(ConfigError::InvalidValue);
            return {};
        }

        bool validate(const VmmConfig& cfg) noexcept {
            return cfg.buffer_size > 0 &&
                   cfg.bench_threads > 0 &&
                   cfg.bench_max_alloc > 0 &&
                   cfg.bench_min_alloc <= cfg.bench_max_alloc;
        }

        vmm_detail::expected<VmmConfig, ConfigError> from_table(const toml::table& root) {
            VmmConfig cfg;
            for (auto&& [section, node] : root) {
                // Only [arena], [logging] and [bench] tables are recognised.
                const auto* tbl = node.as_table();
                if (!tbl) return vmm_detail::unexpected(ConfigError::UnknownKey);
                for (auto&& [key, value] : *tbl) {
                    if (auto r = apply(cfg, section.str(), key.str(), value); !r) {
                        return vmm_detail::unexpected(r.error());
                    }
                }
            }
            if (!validate(cfg)) return vmm_detail::unexpected(ConfigError::InvalidValue);
            return cfg;
        }

    } // namespace

    const char* to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::FileNotFound: return "config file not found";
            case ConfigError::ParseError:   return "config is not valid TOML";
            case ConfigError::UnknownKey:   return "unknown config key";
            case ConfigError::InvalidValue: return "invalid config value";
        }
        return "unknown";
    }

    vmm_detail::expected<VmmConfig, ConfigError> Loader::parse(const std::string& text) {
        try {
            const toml::table root = toml::parse(text);
            return from_table(root);
        } catch (const toml::parse_error&) {
            return vmm_detail::unexpected(ConfigError::ParseError);
        }
    }

    vmm_detail::expected<VmmConfig, ConfigError> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return VmmConfig{};

        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            return vmm_detail::unexpected(ConfigError::FileNotFound);
        }
        try {
            const toml::table root = toml::parse_file(path);
            return from_table(root);
        } catch (const toml::parse_error&) {
            return vmm_detail::unexpected(ConfigError::ParseError);
        }
    }

} // namespace vmm::config
