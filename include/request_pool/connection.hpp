#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

#include "config.hpp"
#include "error.hpp"
#include "result.hpp"
#include "site.hpp"

namespace request_pool {

    /// @brief Reconnects allowed within a single Connection::use() call.
    inline constexpr std::size_t k_max_reconnects = 1;

    /** @brief What a Connection does after one attempt of its work. */
    enum class UseStep {
        Done,       /**< Work succeeded, hand the result back. */
        Reconnect,  /**< Reset on a warm connection, reopen and run again. */
        Propagate,  /**< Reset that may not be retried, surface it. */
        Kill        /**< Any other error, the connection is dead. */
    };

    /// @brief Decide the next step after an attempt.
    /// @param error Error of the attempt, nullptr on success
    /// @param fresh Whether the connection has never completed a use
    /// @param reconnects Reconnects already made in this use() call
    /// @note A fresh connection never reconnects: a reset on first contact
    /// says more about the site than about a stale socket.
    inline UseStep next_use_step(const Error* error, bool fresh,
                                 std::size_t reconnects) noexcept {
        if (error == nullptr) return UseStep::Done;
        if (!is_connection_reset(*error)) return UseStep::Kill;
        if (fresh || reconnects >= k_max_reconnects)
            return UseStep::Propagate;
        return UseStep::Reconnect;
    }

    /**
     * @brief One transport handle bound to one Site, with usage and health
     * tracking.
     * @tparam Transport Provides `handle_type`, whose `close()` is noexcept,
     * and `std::unique_ptr<handle_type> open(const Site&,
     * std::chrono::milliseconds keep_alive)`.
     *
     * The owning pool guarantees a Connection is used by at most one caller
     * at a time, and only closes it from outside once it is no longer
     * checked out. The flags are atomic so the reaper may read them while a
     * use is in flight.
     */
    template <typename Transport>
    class Connection {
       public:
        using transport_type = Transport;
        using handle_type = typename Transport::handle_type;

        /**
         * @brief Opens the first handle immediately.
         * @param transport Factory for handles
         * @param site Site every handle of this connection talks to
         * @param keep_alive Hint passed to the transport on every open
         * @param clock Time source for created/last-used timestamps
         */
        Connection(std::shared_ptr<Transport> transport, Site site,
                   std::chrono::milliseconds keep_alive,
                   time_source clock = {})
            : m_transport(std::move(transport)),
              m_site(std::move(site)),
              m_keep_alive(keep_alive),
              m_clock(std::move(clock)),
              m_created_at(request_pool::now(m_clock)),
              m_handle(open_handle()) {}

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept { close(); }

        /**
         * @brief Run work against the live handle.
         * @param work Callable taking `handle_type&` and returning a
         * Result<T>. It may also throw.
         * @return The Result of the last attempt.
         *
         * A ConnectionReset on a connection that has completed a use before
         * closes the handle, opens a new one and runs work once more. Any
         * other error, thrown or returned, closes the handle and marks the
         * connection dead; exceptions are rethrown unchanged.
         */
        template <typename F>
        auto use(F&& work) -> std::invoke_result_t<F&, handle_type&> {
            using result_type = std::invoke_result_t<F&, handle_type&>;
            static_assert(is_result_v<result_type>,
                          "pooled work must return a Result<T>");

            m_last_used.store(
                request_pool::now(m_clock).time_since_epoch().count(),
                std::memory_order_release);
            m_in_use.store(true, std::memory_order_release);
            UseScope scope{*this};

            std::size_t reconnects = 0;
            for (;;) {
                result_type result = attempt(work);

                switch (next_use_step(result.error_ptr(), fresh(),
                                      reconnects)) {
                    case UseStep::Done:
                        return result;
                    case UseStep::Reconnect:
                        spdlog::debug("Connection to {} reset, reconnecting",
                                      m_site.to_string());
                        close();
                        ++reconnects;
                        continue;
                    case UseStep::Propagate:
                        close();
                        return result;
                    case UseStep::Kill:
                        spdlog::debug("Connection to {} failed ({}): {}",
                                      m_site.to_string(),
                                      to_string(result.error().code),
                                      result.error().message);
                        close();
                        m_dead.store(true, std::memory_order_release);
                        return result;
                }
            }
        }

        /// @brief Release the handle (best-effort). A later use() reopens.
        /// @note Never call concurrently with use()
        void close() noexcept {
            if (!m_handle) return;
            m_handle->close();
            m_handle.reset();
        }

        /// @brief Time since last use, or since creation if never used.
        clock_type::duration idle_time() const {
            const auto since =
                last_used_at().value_or(m_created_at);
            return request_pool::now(m_clock) - since;
        }

        bool in_use() const noexcept {
            return m_in_use.load(std::memory_order_acquire);
        }

        bool dead() const noexcept {
            return m_dead.load(std::memory_order_acquire);
        }

        bool fresh() const noexcept {
            return m_fresh.load(std::memory_order_acquire);
        }

        clock_type::time_point created_at() const noexcept {
            return m_created_at;
        }

        std::optional<clock_type::time_point> last_used_at() const noexcept {
            const auto ticks = m_last_used.load(std::memory_order_acquire);
            if (ticks == k_never_used) return std::nullopt;
            return clock_type::time_point(clock_type::duration(ticks));
        }

        /// @brief Whether a handle is currently held.
        /// @note Only meaningful while the connection is not in use
        bool has_handle() const noexcept { return m_handle != nullptr; }

        const Site& site() const noexcept { return m_site; }

       private:
        static constexpr clock_type::rep k_never_used =
            std::numeric_limits<clock_type::rep>::min();

        /// @brief Clears inUse and fresh on every way out of use().
        struct UseScope {
            Connection& conn;

            ~UseScope() {
                conn.m_fresh.store(false, std::memory_order_release);
                conn.m_in_use.store(false, std::memory_order_release);
            }
        };

        std::unique_ptr<handle_type> open_handle() {
            auto handle = m_transport->open(m_site, m_keep_alive);
            if (!handle) {
                throw std::runtime_error("Transport returned no handle for " +
                                         m_site.to_string());
            }
            return handle;
        }

        template <typename F>
        auto attempt(F& work) -> std::invoke_result_t<F&, handle_type&> {
            try {
                if (!m_handle) m_handle = open_handle();
                return std::invoke(work, *m_handle);
            } catch (...) {
                // Thrown errors are fatal to the connection, never swallowed
                close();
                m_dead.store(true, std::memory_order_release);
                throw;
            }
        }

        std::shared_ptr<Transport> m_transport;
        Site m_site;
        std::chrono::milliseconds m_keep_alive;
        time_source m_clock;
        const clock_type::time_point m_created_at;

        std::unique_ptr<handle_type> m_handle;

        std::atomic<clock_type::rep> m_last_used{k_never_used};
        std::atomic<bool> m_in_use{false};
        std::atomic<bool> m_dead{false};
        std::atomic<bool> m_fresh{true};
    };

}  // namespace request_pool
