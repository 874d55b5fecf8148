#include "request_pool/shared_capacity.hpp"

#include <spdlog/spdlog.h>

namespace request_pool {

    SharedCapacity::SharedCapacity(std::size_t limit) noexcept
        : m_limit(limit) {}

    bool SharedCapacity::try_reserve() {
        std::lock_guard<std::mutex> lk(m_mu);
        if (m_size >= m_limit) return false;
        ++m_size;
        return true;
    }

    void SharedCapacity::release() noexcept {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_size == 0) {
                // Unbalanced release, keep the count sane
                spdlog::error("SharedCapacity released below zero");
            } else {
                --m_size;
            }
            ++m_generation;
        }
        m_cv.notify_all();
    }

    void SharedCapacity::notify() noexcept {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            ++m_generation;
        }
        m_cv.notify_all();
    }

    std::uint64_t SharedCapacity::generation() const noexcept {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_generation;
    }

    bool SharedCapacity::wait_for_change(std::uint64_t seen,
                                         clock_type::time_point deadline) {
        std::unique_lock<std::mutex> lk(m_mu);
        return m_cv.wait_until(lk, deadline,
                               [&] { return m_generation != seen; });
    }

    std::size_t SharedCapacity::size() const noexcept {
        std::lock_guard<std::mutex> lk(m_mu);
        return m_size;
    }

}  // namespace request_pool
