#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace request_pool {

    /// @brief Monotonic clock every pool timestamp is taken from.
    using clock_type = std::chrono::steady_clock;

    /// @brief Source of "now" for idle computations. Empty means
    /// clock_type::now().
    using time_source = std::function<clock_type::time_point()>;

    /// @brief Environment variable overriding the global connection cap.
    inline constexpr const char* k_max_pool_size_env = "MAX_REQUEST_POOL_SIZE";

    /**
     * @brief Configuration for the site-keyed request pool.
     */
    struct RequestPoolConfiguration {
        /** @brief Idle time after which a connection is reaped. Also handed
         * to the transport as its keep-alive hint. */
        std::chrono::milliseconds max_idle_time{30000};

        /** @brief Longest a checkout blocks waiting for a free slot. */
        std::chrono::milliseconds wait_timeout{5000};

        /** @brief Maximum live connections across all sites. */
        std::size_t max_pool_size{512};

        /** @brief Period of the background reaper. Zero or negative disables
         * it. */
        std::chrono::milliseconds reap_frequency{30000};

        /** @brief Clock used for connection timestamps. */
        time_source clock{};
    };

    /**
     * @brief Configuration for the default HTTP transport.
     */
    struct HttpTransportConfiguration {
        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"request_pool/1.0"};

        /** @brief Timeout for resolving and establishing a connection. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U *
                                   1024U};

        /** @brief Whether to verify TLS peer certificates. */
        bool verify_tls{true};
    };

    /// @brief Current time according to the configured source.
    inline clock_type::time_point now(const time_source& clock) {
        return clock ? clock() : clock_type::now();
    }

    /// @brief Parse a positive connection cap, rejecting anything else.
    std::optional<std::size_t> parse_pool_size(std::string_view text);

    /// @brief Apply environment overrides on top of base.
    /// @note Invalid values are logged and ignored.
    RequestPoolConfiguration load_configuration_from_environment(
        RequestPoolConfiguration base = {});

}  // namespace request_pool
