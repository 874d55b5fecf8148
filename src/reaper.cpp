#include "request_pool/reaper.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <exception>
#include <utility>

namespace request_pool {

    Reaper::Reaper(std::chrono::milliseconds frequency,
                   std::function<void()> sweep)
        : m_frequency(frequency),
          m_sweep(std::move(sweep)),
          m_ioc(1),
          m_timer(m_ioc) {}

    Reaper::~Reaper() { stop(); }

    void Reaper::start() {
        if (m_frequency.count() <= 0) {
            spdlog::debug("Reaper disabled (frequency {}ms)",
                          m_frequency.count());
            return;
        }
        if (m_running.exchange(true, std::memory_order_acq_rel)) return;

        // run() returned after a previous stop()
        m_ioc.restart();
        arm();
        m_thread = std::thread([this] { m_ioc.run(); });
        spdlog::debug("Reaper started, sweeping every {}ms",
                      m_frequency.count());
    }

    void Reaper::stop() noexcept {
        if (!m_running.exchange(false, std::memory_order_acq_rel)) return;

        // Cancel on the timer's own thread; a sweep in progress finishes
        // first and then sees m_running cleared
        boost::asio::post(m_ioc, [this] { m_timer.cancel(); });
        if (m_thread.joinable()) m_thread.join();
        spdlog::debug("Reaper stopped after {} sweeps", sweeps());
    }

    void Reaper::arm() {
        m_timer.expires_after(m_frequency);
        m_timer.async_wait(
            [this](const boost::system::error_code& ec) { on_timer(ec); });
    }

    void Reaper::on_timer(const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) return;
        if (!running()) return;

        if (ec) {
            spdlog::error("Reaper timer failed: {}", ec.message());
        } else {
            try {
                m_sweep();
            } catch (const std::exception& e) {
                spdlog::error("Reaper sweep failed: {}", e.what());
            }
            m_sweeps.fetch_add(1, std::memory_order_acq_rel);
        }

        if (running()) arm();
    }

}  // namespace request_pool
