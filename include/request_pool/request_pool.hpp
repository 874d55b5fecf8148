#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config.hpp"
#include "connection.hpp"
#include "error.hpp"
#include "reaper.hpp"
#include "result.hpp"
#include "shared_capacity.hpp"
#include "site.hpp"
#include "site_pool.hpp"

namespace request_pool {

    /**
     * Registry of per-site connection pools under one global connection cap.
     *
     * SAFETY:
     * - All public methods are thread-safe
     * - Lock order: m_mu, then a SitePool's mutex, then SharedCapacity
     *
     * LIFECYCLE:
     * 1. Construction starts the reaper (unless reap_frequency <= 0)
     * 2. with() creates site pools lazily, flush() drops empty ones
     * 3. shutdown() stops the reaper; the destructor calls it and then
     *    closes whatever is left. No with() call may be in flight by then.
     */
    template <typename Transport>
    class BasicRequestPool {
       public:
        using transport_type = Transport;
        using pool_type = SitePool<Transport>;
        using pool_ptr = std::shared_ptr<pool_type>;
        using handle_type = typename Transport::handle_type;

        /// @param cfg Pool limits and timings
        /// @param transport Handle factory; a default-constructed Transport
        /// when null
        explicit BasicRequestPool(
            RequestPoolConfiguration cfg = {},
            std::shared_ptr<Transport> transport = nullptr)
            : m_cfg(std::move(cfg)),
              m_transport(transport ? std::move(transport)
                                    : std::make_shared<Transport>()),
              m_capacity(m_cfg.max_pool_size),
              m_reaper(m_cfg.reap_frequency, [this] { flush(); }) {
            m_reaper.start();
        }

        BasicRequestPool(const BasicRequestPool&) = delete;
        BasicRequestPool& operator=(const BasicRequestPool&) = delete;

        ~BasicRequestPool() { shutdown(); }

        /// @brief Process-wide instance, configured from the environment on
        /// first access.
        static BasicRequestPool& current() {
            static BasicRequestPool instance(
                load_configuration_from_environment());
            return instance;
        }

        /**
         * @brief Run work on a pooled connection to site.
         * @param site Destination; normalized before lookup
         * @param work Callable taking `handle_type&`, returning Result<T>
         * @return work's Result, or PoolExhausted if no connection could be
         * checked out within wait_timeout
         */
        template <typename F>
        auto with(const Site& site, F&& work)
            -> std::invoke_result_t<F&, handle_type&> {
            using result_type = std::invoke_result_t<F&, handle_type&>;

            const Site key = site.normalized();
            for (;;) {
                auto pool = pool_for(key);
                auto lease = pool->checkout();
                if (lease.has_error()) {
                    // The reaper retired this pool after we looked it up
                    if (pool->retired()) continue;
                    return result_type::err(std::move(lease).error());
                }
                return lease.value()->use(work);
            }
        }

        /// @brief with() for the site of an absolute URL.
        template <typename F>
        auto with(std::string_view url, F&& work)
            -> std::invoke_result_t<F&, handle_type&> {
            using result_type = std::invoke_result_t<F&, handle_type&>;

            auto site = Site::from_url(url);
            if (site.has_error())
                return result_type::err(std::move(site).error());
            return with(site.value(), std::forward<F>(work));
        }

        /**
         * @brief Reap sweep: close and remove every connection that is not
         * in use and is dead or idle for at least max_idle_time, then drop
         * pools left empty.
         * @note Pools are removed after the walk so the registry is never
         * mutated while it is being iterated.
         */
        void flush() {
            std::vector<std::pair<Site, pool_ptr>> pools;
            {
                std::shared_lock<std::shared_mutex> lk(m_mu);
                pools.reserve(m_pools.size());
                for (auto const& [site, pool] : m_pools)
                    pools.emplace_back(site, pool);
            }

            std::size_t reaped = 0;
            std::vector<Site> idle_sites;

            for (auto& [site, pool] : pools) {
                for (auto& conn : pool->connections()) {
                    if (conn->in_use()) continue;
                    if (!conn->dead() &&
                        conn->idle_time() < m_cfg.max_idle_time)
                        continue;

                    // Fails if it was checked out since the snapshot
                    if (!pool->remove(conn)) continue;

                    conn->close();
                    ++reaped;
                }

                if (pool->empty()) idle_sites.push_back(site);
            }

            std::size_t dropped = 0;
            if (!idle_sites.empty()) {
                std::unique_lock<std::shared_mutex> lk(m_mu);
                for (auto const& site : idle_sites) {
                    auto it = m_pools.find(site);
                    if (it == m_pools.end()) continue;
                    if (!it->second->retire_if_empty()) continue;
                    m_pools.erase(it);
                    ++dropped;
                }
            }

            if (reaped > 0 || dropped > 0) {
                spdlog::debug(
                    "Reaped {} connections and {} empty pools ({} live)",
                    reaped, dropped, size());
            }
        }

        /// @brief Live connections across all sites.
        std::size_t size() const noexcept { return m_capacity.size(); }

        /// @brief Sites currently holding a pool.
        std::size_t pool_count() const {
            std::shared_lock<std::shared_mutex> lk(m_mu);
            return m_pools.size();
        }

        /// @brief Pool for site if one exists, nullptr otherwise.
        pool_ptr find_pool(const Site& site) const {
            std::shared_lock<std::shared_mutex> lk(m_mu);
            auto it = m_pools.find(site.normalized());
            return it == m_pools.end() ? nullptr : it->second;
        }

        /// @brief Stop the background reaper. Idempotent.
        void shutdown() noexcept { m_reaper.stop(); }

        const RequestPoolConfiguration& config() const noexcept {
            return m_cfg;
        }

        const Reaper& reaper() const noexcept { return m_reaper; }

        Transport& transport() const noexcept { return *m_transport; }

       private:
        pool_ptr pool_for(const Site& site) {
            {
                std::shared_lock<std::shared_mutex> lk(m_mu);
                auto it = m_pools.find(site);
                if (it != m_pools.end()) return it->second;
            }

            std::unique_lock<std::shared_mutex> lk(m_mu);
            auto it = m_pools.find(site);
            if (it != m_pools.end()) return it->second;

            auto pool = std::make_shared<pool_type>(site, m_transport,
                                                    m_capacity, m_cfg);
            m_pools.emplace(site, pool);
            spdlog::debug("Created pool for {}", site.to_string());
            return pool;
        }

        RequestPoolConfiguration m_cfg;
        std::shared_ptr<Transport> m_transport;
        SharedCapacity m_capacity;

        mutable std::shared_mutex m_mu;
        std::unordered_map<Site, pool_ptr> m_pools;

        // Last, so it is stopped before the pools go away
        Reaper m_reaper;
    };

}  // namespace request_pool
