#pragma once
#include <string>

namespace request_pool {
    /**
     * @brief Represents an error raised while checking out or using a pooled
     * connection.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,         /**< The provided URL is malformed or invalid. */
            ConnectionFailed,   /**< Failed to establish a TCP connection. */
            ConnectionReset,    /**< Peer closed or reset the connection. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            Timeout,            /**< An I/O operation timed out. */
            SendFailed,         /**< Failed to send the request. */
            ReceiveFailed,      /**< Failed to receive the response. */
            NetworkError,       /**< General network error. */
            PoolExhausted, /**< No connection slot freed up within the wait
                              timeout. */
            Shutdown,      /**< The pool no longer hands out connections. */
            Unknown,       /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to a string for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::ConnectionReset:
                return "ConnectionReset";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::PoolExhausted:
                return "PoolExhausted";
            case Error::Code::Shutdown:
                return "Shutdown";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief True for the one transient condition a pooled connection may
    /// reconnect and retry on.
    inline bool is_connection_reset(const Error& error) noexcept {
        return error.code == Error::Code::ConnectionReset;
    }
}  // namespace request_pool
