#pragma once
#include <boost/beast/http/verb.hpp>

namespace request_pool {
    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
    };

    inline constexpr boost::beast::http::verb to_boost_http_method(
        HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
        }
        return http::verb::unknown;
    }

}  // namespace request_pool
