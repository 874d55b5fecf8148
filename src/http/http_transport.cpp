#include "request_pool/http/http_transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/system_error.hpp>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace request_pool {

    Error::Code classify_network_error(const boost::system::error_code& ec,
                                       Error::Code fallback) noexcept {
        if (ec == net::error::connection_reset || ec == net::error::eof ||
            ec == net::error::broken_pipe ||
            ec == net::error::connection_aborted ||
            ec == http::error::end_of_stream ||
            ec == ssl::error::stream_truncated) {
            return Error::Code::ConnectionReset;
        }
        if (ec == beast::error::timeout || ec == net::error::timed_out) {
            return Error::Code::Timeout;
        }
        return fallback;
    }

    bool set_sni(beast::ssl_stream<beast::tcp_stream>& stream,
                 const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(static_cast<int>(::ERR_get_error()),
                                           net::error::get_ssl_category());
            return false;
        }
        return true;
    }

    void init_tls_on_ssl_context(ssl::context& ssl_context) {
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }
        ssl_context.set_verify_mode(ssl::verify_peer);
    }

    // ---- HttpHandle ----

    HttpHandle::HttpHandle(ssl::context& ssl_ctx, Site site,
                           std::chrono::milliseconds keep_alive,
                           HttpTransportConfiguration cfg)
        : m_ioc(1),
          m_ssl_ctx(ssl_ctx),
          m_site(std::move(site)),
          m_keep_alive(keep_alive),
          m_cfg(std::move(cfg)) {
        m_site.normalize_default_port();
        m_site.normalize_host();
    }

    HttpHandle::~HttpHandle() noexcept { close(); }

    void HttpHandle::close() noexcept {
        boost::system::error_code ec;

        if (auto* s = std::get_if<HttpStream>(&m_stream)) {
            s->socket().shutdown(tcp::socket::shutdown_both, ec);
            s->socket().close(ec);
        } else if (auto* s = std::get_if<HttpsStream>(&m_stream)) {
            // No TLS shutdown, just drop the TCP socket
            beast::get_lowest_layer(*s).socket().shutdown(
                tcp::socket::shutdown_both, ec);
            beast::get_lowest_layer(*s).socket().close(ec);
        }

        m_stream.emplace<std::monostate>();
        m_buffer.consume(m_buffer.size());
    }

    bool HttpHandle::is_open() const noexcept {
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;

                if constexpr (std::is_same_v<T, std::monostate>) {
                    return false;
                } else if constexpr (std::is_same_v<T, HttpStream>) {
                    return s.socket().is_open();
                } else {
                    return beast::get_lowest_layer(s).socket().is_open();
                }
            },
            m_stream);
    }

    void HttpHandle::run_pending() {
        m_ioc.restart();
        m_ioc.run();
    }

    Result<Response> HttpHandle::request(const Request& req) {
        if (to_boost_http_method(req.method) == http::verb::unknown) {
            return Result<Response>::err(Error::Code::Unknown,
                                         "Unknown HTTP method");
        }

        Error::Code failure = Error::Code::ConnectionFailed;
        if (auto ec = ensure_connected(failure)) {
            return Result<Response>::err(
                failure,
                "Connect to " + m_site.to_string() + " failed: " + ec.message());
        }

        auto beast_req = prepare_beast_request(req, m_site, m_cfg.user_agent);

        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return exchange(*s, beast_req);
        return exchange(std::get<HttpStream>(m_stream), beast_req);
    }

    template <typename S>
    Result<Response> HttpHandle::exchange(
        S& stream, http::request<http::string_body>& req) {
        boost::system::error_code ec;

        beast::get_lowest_layer(stream).expires_after(m_keep_alive);
        http::async_write(stream, req,
                          [&ec](const boost::system::error_code& e,
                                std::size_t) { ec = e; });
        run_pending();
        if (ec) {
            close();
            return Result<Response>::err(
                classify_network_error(ec, Error::Code::SendFailed),
                "Write failed: " + ec.message());
        }

        m_buffer.consume(m_buffer.size());
        http::response_parser<http::string_body> parser;
        parser.body_limit(m_cfg.max_body_bytes);
        if (req.method() == http::verb::head) parser.skip(true);

        beast::get_lowest_layer(stream).expires_after(m_keep_alive);
        http::async_read(stream, m_buffer, parser,
                         [&ec](const boost::system::error_code& e,
                               std::size_t) { ec = e; });
        run_pending();
        if (ec) {
            close();
            return Result<Response>::err(
                classify_network_error(ec, Error::Code::ReceiveFailed),
                "Read failed: " + ec.message());
        }

        beast::get_lowest_layer(stream).expires_never();

        auto beast_res = parser.release();
        const bool keep_alive = beast_res.keep_alive();
        Response out = parse_beast_response(std::move(beast_res));

        // Server is closing its end; reconnect on the next request
        if (!keep_alive) close();

        return Result<Response>::ok(std::move(out));
    }

    boost::system::error_code HttpHandle::ensure_connected(
        Error::Code& failure) {
        boost::system::error_code ec;
        if (is_open()) return ec;

        close();

        tcp::resolver resolver(m_ioc);
        auto results = resolver.resolve(m_site.host, m_site.port, ec);
        if (ec) {
            failure = Error::Code::ConnectionFailed;
            return ec;
        }

        auto on_connect = [&ec](const boost::system::error_code& e,
                                const tcp::endpoint&) { ec = e; };

        if (!m_site.https) {
            auto& s = m_stream.emplace<HttpStream>(m_ioc);
            s.expires_after(m_cfg.connect_timeout);
            s.async_connect(results, on_connect);
            run_pending();
            if (ec) {
                failure =
                    classify_network_error(ec, Error::Code::ConnectionFailed);
                close();
                return ec;
            }
            s.expires_never();
            spdlog::debug("Connected to {}", m_site.to_string());
            return ec;
        }

        auto& s = m_stream.emplace<HttpsStream>(m_ioc, m_ssl_ctx);

        if (!set_sni(s, m_site.host, ec)) {
            failure = Error::Code::TlsHandshakeFailed;
            close();
            return ec;
        }

        beast::get_lowest_layer(s).expires_after(m_cfg.connect_timeout);
        beast::get_lowest_layer(s).async_connect(results, on_connect);
        run_pending();
        if (ec) {
            failure = classify_network_error(ec, Error::Code::ConnectionFailed);
            close();
            return ec;
        }

        beast::get_lowest_layer(s).expires_after(m_cfg.connect_timeout);
        s.async_handshake(
            ssl::stream_base::client,
            [&ec](const boost::system::error_code& e) { ec = e; });
        run_pending();
        if (ec) {
            failure =
                classify_network_error(ec, Error::Code::TlsHandshakeFailed);
            close();
            return ec;
        }

        beast::get_lowest_layer(s).expires_never();
        spdlog::debug("Connected to {} (TLS)", m_site.to_string());
        return ec;
    }

    // ---- HttpTransport ----

    HttpTransport::HttpTransport(HttpTransportConfiguration cfg)
        : m_cfg(std::move(cfg)), m_ssl_ctx(ssl::context::tls_client) {
        if (m_cfg.verify_tls) {
            init_tls_on_ssl_context(m_ssl_ctx);
        } else {
            m_ssl_ctx.set_verify_mode(ssl::verify_none);
            spdlog::warn("TLS peer verification is disabled");
        }
    }

    std::unique_ptr<HttpHandle> HttpTransport::open(
        const Site& site, std::chrono::milliseconds keep_alive) {
        return std::make_unique<HttpHandle>(m_ssl_ctx, site, keep_alive, m_cfg);
    }

}  // namespace request_pool
