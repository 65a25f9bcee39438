/**
 * @file buffer_cache_config.cpp
 * @brief Validation and environment loading of the cache configuration
 */

#include <mediacache/buffer/buffer_cache_config.hpp>

#include <mediacache/compat/format.hpp>

#include <charconv>
#include <cstdlib>
#include <optional>

namespace mediacache::buffer {

namespace {

constexpr const char* kModule = "buffer_cache_config";

auto get_env(const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

auto parse_size(const std::string& text) -> std::optional<size_t> {
    size_t value = 0;
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (text.empty() || ec != std::errc{} || ptr != last || value == 0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto buffer_cache_config::validate() const -> VoidResult {
    if (max_buffers == 0) {
        return cache_void_error(error_codes::invalid_configuration,
                                "max_buffers must be at least 1", kModule);
    }
    if (max_total_size_mb == 0) {
        return cache_void_error(error_codes::invalid_configuration,
                                "max_total_size_mb must be at least 1", kModule);
    }
    if (max_page_size == 0) {
        return cache_void_error(error_codes::invalid_configuration,
                                "max_page_size must be at least 1", kModule);
    }
    if (default_page_size == 0 || default_page_size > max_page_size) {
        return cache_void_error(
            error_codes::invalid_configuration,
            compat::format("default_page_size must be in [1, {}]", max_page_size),
            kModule);
    }
    if (estimated_row_bytes == 0) {
        return cache_void_error(error_codes::invalid_configuration,
                                "estimated_row_bytes must be at least 1", kModule);
    }
    return ok();
}

auto buffer_cache_config::from_environment() -> Result<buffer_cache_config> {
    return from_environment("MEDIACACHE_");
}

auto buffer_cache_config::from_environment(const std::string& prefix)
    -> Result<buffer_cache_config> {
    buffer_cache_config config;

    struct env_field {
        const char* suffix;
        size_t buffer_cache_config::*field;
    };

    static constexpr env_field fields[] = {
        {"MAX_BUFFERS", &buffer_cache_config::max_buffers},
        {"MAX_SIZE_MB", &buffer_cache_config::max_total_size_mb},
        {"PAGE_SIZE", &buffer_cache_config::default_page_size},
        {"MAX_PAGE_SIZE", &buffer_cache_config::max_page_size},
        {"ROW_BYTES", &buffer_cache_config::estimated_row_bytes},
    };

    for (const auto& entry : fields) {
        auto name = prefix + entry.suffix;
        if (auto value = get_env(name)) {
            auto parsed = parse_size(*value);
            if (!parsed) {
                return cache_error<buffer_cache_config>(
                    error_codes::invalid_configuration,
                    compat::format("{}='{}' is not a positive integer", name, *value),
                    kModule);
            }
            config.*entry.field = *parsed;
        }
    }

    auto validation = config.validate();
    if (validation.is_err()) {
        return Result<buffer_cache_config>::err(validation.error());
    }
    return ok(std::move(config));
}

}  // namespace mediacache::buffer
