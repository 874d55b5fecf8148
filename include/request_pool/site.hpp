#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

#include "result.hpp"

namespace request_pool {

    /// @brief A remote endpoint. Each distinct Site gets its own pool.
    struct Site {
        std::string host;
        std::string port;
        bool https{false};

        void clear() {
            host.clear();
            port.clear();
            https = false;
        }

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        /// @brief Copy with default port and lower-case host applied.
        Site normalized() const {
            Site out = *this;
            out.normalize_default_port();
            out.normalize_host();
            return out;
        }

        /// @brief "https://host:port", for logs.
        std::string to_string() const {
            return std::string(https ? "https://" : "http://") + host + ":" +
                   port;
        }

        /// @brief Site of an absolute http:// or https:// URL. Path, query
        /// and fragment are ignored.
        static Result<Site> from_url(std::string_view url);

        friend bool operator==(Site const& a, Site const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }

        friend bool operator!=(Site const& a, Site const& b) noexcept {
            return !(a == b);
        }
    };

    inline Result<Site> Site::from_url(std::string_view url) {
        auto make_err = [](std::string msg) {
            return Result<Site>::err(Error::Code::InvalidUrl, std::move(msg));
        };

        Site out;
        if (url.rfind("https://", 0) == 0) {
            out.https = true;
            url.remove_prefix(std::string_view("https://").size());
        } else if (url.rfind("http://", 0) == 0) {
            url.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        std::string_view hostport = url;
        if (auto end = url.find_first_of("/?#"); end != std::string_view::npos)
            hostport = url.substr(0, end);

        if (hostport.empty()) return make_err("URL missing host");

        // Last ':' splits host and port
        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
            if (out.port.empty()) return make_err("URL has empty port");
            if (!std::all_of(out.port.begin(), out.port.end(), [](char c) {
                    return std::isdigit(static_cast<unsigned char>(c));
                })) {
                return make_err("URL has non-numeric port");
            }
        } else {
            out.host = std::string(hostport);
        }

        if (out.host.empty()) return make_err("URL has empty host");

        out.normalize_default_port();
        out.normalize_host();
        return Result<Site>::ok(std::move(out));
    }

}  // namespace request_pool

namespace std {
    template <>
    struct hash<request_pool::Site> {
        size_t operator()(request_pool::Site const& s) const noexcept {
            // FNV-1a over scheme, host and port
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view v) {
                for (unsigned char c : v) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(s.https);
            h *= 1099511628211ull;
            mix(s.host);
            mix(s.port);
            return h;
        }
    };
}  // namespace std
