#pragma once

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <thread>

namespace request_pool {

    /**
     * @brief Runs a sweep on a fixed period from a dedicated thread.
     *
     * The timer lives on a private io_context. stop() cancels the pending
     * wait and joins the thread, so once it returns no sweep is running or
     * will run.
     */
    class Reaper {
       public:
        /// @param frequency Sweep period; zero or negative disables the
        /// reaper
        /// @param sweep Called once per period
        Reaper(std::chrono::milliseconds frequency,
               std::function<void()> sweep);

        Reaper(const Reaper&) = delete;
        Reaper& operator=(const Reaper&) = delete;

        ~Reaper();

        /// @brief Start the background thread. No-op when disabled or
        /// already started.
        void start();

        void stop() noexcept;

        bool running() const noexcept {
            return m_running.load(std::memory_order_acquire);
        }

        /// @brief Number of sweeps completed by the timer.
        std::uint64_t sweeps() const noexcept {
            return m_sweeps.load(std::memory_order_acquire);
        }

        std::chrono::milliseconds frequency() const noexcept {
            return m_frequency;
        }

       private:
        void arm();
        void on_timer(const boost::system::error_code& ec);

        std::chrono::milliseconds m_frequency;
        std::function<void()> m_sweep;

        boost::asio::io_context m_ioc;
        boost::asio::steady_timer m_timer;
        std::thread m_thread;

        std::atomic<bool> m_running{false};
        std::atomic<std::uint64_t> m_sweeps{0};
    };

}  // namespace request_pool
