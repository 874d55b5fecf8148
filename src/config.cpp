#include "request_pool/config.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <limits>

namespace request_pool {

    std::optional<std::size_t> parse_pool_size(std::string_view text) {
        while (!text.empty() &&
               std::isspace(static_cast<unsigned char>(text.front()))) {
            text.remove_prefix(1);
        }
        while (!text.empty() &&
               std::isspace(static_cast<unsigned char>(text.back()))) {
            text.remove_suffix(1);
        }
        if (text.empty()) return std::nullopt;

        std::size_t value = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return std::nullopt;
            const auto digit = static_cast<std::size_t>(c - '0');
            if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10)
                return std::nullopt;
            value = value * 10 + digit;
        }

        if (value == 0) return std::nullopt;
        return value;
    }

    RequestPoolConfiguration load_configuration_from_environment(
        RequestPoolConfiguration base) {
        const char* raw = std::getenv(k_max_pool_size_env);
        if (raw == nullptr) return base;

        if (auto size = parse_pool_size(raw)) {
            base.max_pool_size = *size;
            spdlog::debug("{}={} overrides the global connection cap",
                          k_max_pool_size_env, *size);
        } else {
            spdlog::warn("Ignoring invalid {}='{}', keeping {}",
                         k_max_pool_size_env, raw, base.max_pool_size);
        }
        return base;
    }

}  // namespace request_pool
