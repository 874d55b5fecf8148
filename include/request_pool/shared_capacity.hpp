#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "config.hpp"

namespace request_pool {

    /**
     * Global live-connection counter shared by every SitePool of a registry.
     *
     * It is the single source of truth for admission control: a pool may
     * only create a connection after try_reserve() succeeded, and gives the
     * slot back with release() when that connection is permanently removed.
     *
     * Waiters block on a change generation rather than on the count itself,
     * so a caller of one site wakes both when another site frees a slot and
     * when a connection of its own site is checked back in. Sampling
     * generation() before inspecting pool state and passing it to
     * wait_for_change() closes the lost-wakeup window.
     */
    class SharedCapacity {
       public:
        explicit SharedCapacity(std::size_t limit) noexcept;

        SharedCapacity(const SharedCapacity&) = delete;
        SharedCapacity& operator=(const SharedCapacity&) = delete;

        /// @brief Take one slot if the count is below the limit.
        [[nodiscard]] bool try_reserve();

        /// @brief Give one slot back and wake waiters.
        void release() noexcept;

        /// @brief Wake waiters without changing the count (a checkin).
        void notify() noexcept;

        std::uint64_t generation() const noexcept;

        /// @brief Block until the generation moves past seen or the deadline
        /// passes.
        /// @return false on timeout
        bool wait_for_change(std::uint64_t seen,
                             clock_type::time_point deadline);

        std::size_t size() const noexcept;
        std::size_t limit() const noexcept { return m_limit; }

       private:
        const std::size_t m_limit;

        mutable std::mutex m_mu;
        std::condition_variable m_cv;
        std::size_t m_size{0};
        std::uint64_t m_generation{0};
    };

}  // namespace request_pool
