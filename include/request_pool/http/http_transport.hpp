#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <variant>

#include "../config.hpp"
#include "../error.hpp"
#include "../request_pool.hpp"
#include "../result.hpp"
#include "../site.hpp"
#include "request.hpp"
#include "response.hpp"

namespace request_pool {

    /// @brief Map a Boost/Beast I/O error to an Error code.
    /// @param fallback Code for errors that are neither a reset nor a
    /// timeout
    /// @note Peer resets, EOF, broken pipes, HTTP end of stream and TLS
    /// truncation all become ConnectionReset, the only retryable code.
    Error::Code classify_network_error(const boost::system::error_code& ec,
                                       Error::Code fallback) noexcept;

    /// @brief Set SNI on a TLS stream.
    bool set_sni(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
                 const std::string& host, boost::system::error_code& ec);

    /// @brief Load the system CA store and require peer verification.
    void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context);

    /**
     * @brief A persistent HTTP/1.1 connection to one Site.
     *
     * Connects lazily on the first request and again after the socket was
     * closed. Each handle drives its I/O on a private io_context so every
     * step can be bounded by a timeout while the API stays blocking. A
     * handle is used by one thread at a time.
     */
    class HttpHandle {
       private:
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        /**
         * @brief Constructs an unconnected handle.
         * @param ssl_ctx TLS context, must outlive the handle.
         * @param site Target site.
         * @param keep_alive Upper bound for each write and read.
         * @param cfg Transport settings.
         */
        HttpHandle(boost::asio::ssl::context& ssl_ctx, Site site,
                   std::chrono::milliseconds keep_alive,
                   HttpTransportConfiguration cfg);

        HttpHandle(const HttpHandle&) = delete;
        HttpHandle& operator=(const HttpHandle&) = delete;
        HttpHandle(HttpHandle&&) = delete;
        HttpHandle& operator=(HttpHandle&&) = delete;

        ~HttpHandle() noexcept;

        /**
         * @brief Perform one request/response exchange.
         * @return The response, or an Error whose code tells a stale
         * connection (ConnectionReset) from other failures.
         */
        [[nodiscard]] Result<Response> request(const Request& req);

        /// @brief Close the socket if open (best-effort, no TLS shutdown).
        void close() noexcept;

        bool is_open() const noexcept;

        const Site& site() const noexcept { return m_site; }

        std::chrono::milliseconds keep_alive() const noexcept {
            return m_keep_alive;
        }

       private:
        boost::system::error_code ensure_connected(Error::Code& failure);

        template <typename S>
        Result<Response> exchange(
            S& stream,
            boost::beast::http::request<boost::beast::http::string_body>& req);

        void run_pending();

        boost::asio::io_context m_ioc;
        boost::asio::ssl::context& m_ssl_ctx;

        Site m_site;
        std::chrono::milliseconds m_keep_alive;
        HttpTransportConfiguration m_cfg;

        boost::beast::flat_buffer m_buffer{};
        Stream m_stream;
    };

    /**
     * @brief Default transport: opens HttpHandles sharing one TLS context.
     */
    class HttpTransport {
       public:
        using handle_type = HttpHandle;

        explicit HttpTransport(HttpTransportConfiguration cfg = {});

        HttpTransport(const HttpTransport&) = delete;
        HttpTransport& operator=(const HttpTransport&) = delete;

        /// @brief New, not yet connected handle for site.
        std::unique_ptr<HttpHandle> open(const Site& site,
                                         std::chrono::milliseconds keep_alive);

        const HttpTransportConfiguration& config() const noexcept {
            return m_cfg;
        }

       private:
        HttpTransportConfiguration m_cfg;
        boost::asio::ssl::context m_ssl_ctx;
    };

    /// @brief Site-keyed pool of persistent HTTP connections.
    using RequestPool = BasicRequestPool<HttpTransport>;

}  // namespace request_pool
