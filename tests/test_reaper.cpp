#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

#include "request_pool/config.hpp"
#include "request_pool/reaper.hpp"

using namespace request_pool;
using namespace std::chrono_literals;

namespace {

    template <typename Pred>
    bool wait_until(Pred pred, std::chrono::milliseconds timeout = 3s) {
        const auto deadline = clock_type::now() + timeout;
        while (!pred()) {
            if (clock_type::now() >= deadline) return false;
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }

}  // namespace

TEST(ReaperTest, NonPositiveFrequencyDisables) {
    std::atomic<int> calls{0};
    Reaper zero(0ms, [&] { ++calls; });
    Reaper negative(-5ms, [&] { ++calls; });

    zero.start();
    negative.start();
    EXPECT_FALSE(zero.running());
    EXPECT_FALSE(negative.running());

    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(calls.load(), 0);
}

TEST(ReaperTest, SweepsPeriodically) {
    std::atomic<int> calls{0};
    Reaper reaper(5ms, [&] { ++calls; });
    reaper.start();
    EXPECT_TRUE(reaper.running());
    EXPECT_EQ(reaper.frequency(), 5ms);

    EXPECT_TRUE(wait_until([&] { return calls.load() >= 3; }));
    reaper.stop();
    EXPECT_GE(reaper.sweeps(), 3u);
}

TEST(ReaperTest, NoSweepAfterStop) {
    std::atomic<int> calls{0};
    Reaper reaper(5ms, [&] { ++calls; });
    reaper.start();
    ASSERT_TRUE(wait_until([&] { return calls.load() >= 1; }));

    reaper.stop();
    EXPECT_FALSE(reaper.running());
    const int after_stop = calls.load();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(calls.load(), after_stop);

    // Idempotent
    reaper.stop();
}

TEST(ReaperTest, StopWaitsForSweepInProgress) {
    std::atomic<bool> in_sweep{false};
    std::atomic<bool> finished{false};
    Reaper reaper(5ms, [&] {
        in_sweep = true;
        std::this_thread::sleep_for(50ms);
        finished = true;
    });
    reaper.start();
    ASSERT_TRUE(wait_until([&] { return in_sweep.load(); }));

    reaper.stop();
    EXPECT_TRUE(finished.load());
}

TEST(ReaperTest, ThrowingSweepKeepsRunning) {
    std::atomic<int> calls{0};
    Reaper reaper(5ms, [&] {
        ++calls;
        throw std::runtime_error("sweep failed");
    });
    reaper.start();

    EXPECT_TRUE(wait_until([&] { return calls.load() >= 2; }));
    reaper.stop();
}

TEST(ReaperTest, CanRestartAfterStop) {
    std::atomic<int> calls{0};
    Reaper reaper(5ms, [&] { ++calls; });

    reaper.start();
    ASSERT_TRUE(wait_until([&] { return calls.load() >= 1; }));
    reaper.stop();

    const int before = calls.load();
    reaper.start();
    EXPECT_TRUE(wait_until([&] { return calls.load() > before; }));
    reaper.stop();
}
