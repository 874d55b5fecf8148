#pragma once
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <unordered_map>

#include "../site.hpp"
#include "http_method.hpp"

namespace request_pool {

    /// @brief One HTTP request sent over a pooled connection. The Site is
    /// implied by the connection, so only the request target is carried.
    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string target{"/"};
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;
    };

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    /// @brief Host header value: the port is omitted when it is the
    /// scheme's default.
    inline std::string host_header(const Site& site) {
        const bool default_port = site.https ? site.port == "443"
                                             : site.port == "80";
        return default_port ? site.host : site.host + ":" + site.port;
    }

    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const Site& site,
                          const std::string& user_agent) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(req.target.empty() ? "/" : req.target);
        beast_req.set(http::field::host, host_header(site));
        beast_req.set(http::field::user_agent, user_agent);
        // Pooled connections are persistent
        beast_req.keep_alive(true);
        apply_request_headers(req.headers, beast_req.base());
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
            beast_req.prepare_payload();
        }
        return beast_req;
    }

}  // namespace request_pool
