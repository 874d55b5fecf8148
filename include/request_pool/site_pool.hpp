#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "result.hpp"
#include "shared_capacity.hpp"
#include "site.hpp"

namespace request_pool {

    /**
     * Bounded, blocking pool of Connections to a single Site.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - Capacity is reserved in the registry-wide SharedCapacity, there is
     *   no per-site limit
     * - close() on a Connection never runs under m_mu
     *
     * INVARIANTS:
     * 1. m_idle is a subset of m_connections
     * 2. Every connection in m_connections holds one SharedCapacity slot
     * 3. A connection is either idle or checked out to exactly one Lease
     * 4. Dead connections are never idle
     * 5. Once retired, the pool holds no connection and never creates one
     *
     * LIFECYCLE:
     * 1. Created by the registry on first use of its Site
     * 2. checkout() / Lease destruction move connections out and back in
     * 3. The reaper removes idle connections, then retire_if_empty()
     * 4. A retired pool refuses checkout with Error::Code::Shutdown
     */
    template <typename Transport>
    class SitePool : public std::enable_shared_from_this<SitePool<Transport>> {
       public:
        using connection_type = Connection<Transport>;
        using connection_ptr = std::shared_ptr<connection_type>;
        using handle_type = typename connection_type::handle_type;

        /// @brief Exclusive claim on a checked out connection. Destroying
        /// or resetting it checks the connection back in.
        class Lease {
           public:
            Lease() = default;

            ~Lease() { reset(); }

            Lease(const Lease&) = delete;
            Lease& operator=(const Lease&) = delete;

            Lease(Lease&& other) noexcept
                : m_pool(std::move(other.m_pool)),
                  m_conn(std::move(other.m_conn)) {}

            Lease& operator=(Lease&& other) noexcept {
                if (this != &other) {
                    reset();
                    m_pool = std::move(other.m_pool);
                    m_conn = std::move(other.m_conn);
                }
                return *this;
            }

            connection_type* operator->() const noexcept {
                return m_conn.get();
            }

            connection_type& operator*() const noexcept { return *m_conn; }

            connection_ptr get() const noexcept { return m_conn; }

            explicit operator bool() const noexcept {
                return static_cast<bool>(m_conn);
            }

            /// @brief Check the connection back in now.
            void reset() noexcept {
                if (!m_conn) return;
                auto pool = std::move(m_pool);
                auto conn = std::move(m_conn);
                if (pool) pool->checkin(conn);
            }

           private:
            friend class SitePool;

            Lease(std::shared_ptr<SitePool> pool, connection_ptr conn) noexcept
                : m_pool(std::move(pool)), m_conn(std::move(conn)) {}

            std::shared_ptr<SitePool> m_pool;
            connection_ptr m_conn;
        };

        SitePool(Site site, std::shared_ptr<Transport> transport,
                 SharedCapacity& capacity, RequestPoolConfiguration cfg)
            : m_site(std::move(site)),
              m_transport(std::move(transport)),
              m_capacity(capacity),
              m_cfg(std::move(cfg)) {}

        SitePool(const SitePool&) = delete;
        SitePool& operator=(const SitePool&) = delete;

        /// @brief Connections still held go back to the shared capacity.
        ~SitePool() {
            std::vector<connection_ptr> held;
            {
                std::lock_guard<std::mutex> lk(m_mu);
                held.swap(m_connections);
                m_idle.clear();
            }
            for (auto& conn : held) {
                conn->close();
                m_capacity.release();
            }
        }

        /**
         * @brief Check out an idle connection, or create one if the shared
         * capacity allows.
         * @return Lease on success; PoolExhausted when no slot frees up
         * within wait_timeout; Shutdown when the pool was retired.
         * @note Blocks the calling thread for at most wait_timeout. May
         * throw if the transport fails to open a handle.
         */
        Result<Lease> checkout() {
            const auto deadline = clock_type::now() + m_cfg.wait_timeout;

            for (;;) {
                // Sampled before looking at the pool so a checkin or release
                // racing with this pass still wakes us
                const auto seen = m_capacity.generation();
                bool reserved = false;

                {
                    std::lock_guard<std::mutex> lk(m_mu);

                    if (m_retired) {
                        return Result<Lease>::err(
                            Error::Code::Shutdown,
                            "Pool for " + m_site.to_string() + " is retired");
                    }

                    // Most recently returned first, so surplus connections
                    // age out
                    if (!m_idle.empty()) {
                        auto conn = std::move(m_idle.back());
                        m_idle.pop_back();
                        return Result<Lease>::ok(
                            Lease(this->shared_from_this(), std::move(conn)));
                    }

                    if (m_capacity.try_reserve()) {
                        ++m_creating;
                        reserved = true;
                    }
                }

                if (reserved) return Result<Lease>::ok(create_reserved());

                if (!m_capacity.wait_for_change(seen, deadline)) {
                    spdlog::warn(
                        "Checkout for {} timed out after {}ms ({} of {} "
                        "connections live)",
                        m_site.to_string(), m_cfg.wait_timeout.count(),
                        m_capacity.size(), m_capacity.limit());
                    return Result<Lease>::err(
                        Error::Code::PoolExhausted,
                        "No connection available for " + m_site.to_string() +
                            " within " +
                            std::to_string(m_cfg.wait_timeout.count()) + "ms");
                }
            }
        }

        /**
         * @brief Check out a connection, run work on it and check it back
         * in.
         * @return The Result of work, or the checkout error.
         */
        template <typename F>
        auto with_connection(F&& work)
            -> std::invoke_result_t<F&, handle_type&> {
            using result_type = std::invoke_result_t<F&, handle_type&>;

            auto lease = checkout();
            if (lease.has_error())
                return result_type::err(std::move(lease).error());
            return lease.value()->use(work);
        }

        /// @brief Snapshot of every connection, idle or checked out.
        std::vector<connection_ptr> connections() const {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_connections;
        }

        /**
         * @brief Remove an idle connection and release its slot.
         * @return false if conn is checked out or not in this pool
         * @note Does not close conn; the caller owns it afterwards.
         */
        bool remove(const connection_ptr& conn) {
            {
                std::lock_guard<std::mutex> lk(m_mu);
                auto idle_it = std::find(m_idle.begin(), m_idle.end(), conn);
                if (idle_it == m_idle.end()) return false;
                m_idle.erase(idle_it);
                erase_locked_(conn);
            }
            m_capacity.release();
            return true;
        }

        bool empty() const {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_connections.empty() && m_creating == 0;
        }

        std::size_t size() const {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_connections.size();
        }

        std::size_t idle_count() const {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_idle.size();
        }

        /// @brief Retire the pool if it holds nothing and nothing is being
        /// created. Retirement is permanent.
        bool retire_if_empty() {
            std::lock_guard<std::mutex> lk(m_mu);
            if (!m_connections.empty() || m_creating != 0) return false;
            m_retired = true;
            return true;
        }

        bool retired() const {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_retired;
        }

        const Site& site() const noexcept { return m_site; }

       private:
        /// @brief Build a connection for a slot reserved by checkout().
        Lease create_reserved() {
            connection_ptr conn;
            try {
                conn = std::make_shared<connection_type>(
                    m_transport, m_site, m_cfg.max_idle_time, m_cfg.clock);
            } catch (...) {
                {
                    std::lock_guard<std::mutex> lk(m_mu);
                    --m_creating;
                }
                m_capacity.release();
                throw;
            }

            {
                std::lock_guard<std::mutex> lk(m_mu);
                --m_creating;
                m_connections.push_back(conn);
            }

            spdlog::debug("Opened connection to {} ({} live)",
                          m_site.to_string(), m_capacity.size());
            return Lease(this->shared_from_this(), std::move(conn));
        }

        void checkin(const connection_ptr& conn) noexcept {
            const bool discard = conn->dead();
            {
                std::lock_guard<std::mutex> lk(m_mu);
                if (discard) {
                    erase_locked_(conn);
                } else {
                    m_idle.push_back(conn);
                }
            }

            if (discard) {
                spdlog::debug("Discarding dead connection to {}",
                              m_site.to_string());
                conn->close();
                m_capacity.release();
            } else {
                m_capacity.notify();
            }
        }

        void erase_locked_(const connection_ptr& conn) {
            auto it =
                std::find(m_connections.begin(), m_connections.end(), conn);
            if (it != m_connections.end()) m_connections.erase(it);
        }

        Site m_site;
        std::shared_ptr<Transport> m_transport;
        SharedCapacity& m_capacity;
        RequestPoolConfiguration m_cfg;

        mutable std::mutex m_mu;
        std::vector<connection_ptr> m_connections;
        std::deque<connection_ptr> m_idle;
        std::size_t m_creating{0};
        bool m_retired{false};
    };

}  // namespace request_pool
