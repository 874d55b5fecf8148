#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "fake_transport.hpp"
#include "request_pool/shared_capacity.hpp"
#include "request_pool/site_pool.hpp"

using namespace request_pool;
using namespace request_pool::fakes;
using namespace std::chrono_literals;

namespace {

    using FakeSitePool = SitePool<FakeTransport>;

    RequestPoolConfiguration default_cfg() {
        RequestPoolConfiguration cfg;
        cfg.wait_timeout = 50ms;
        cfg.max_idle_time = 30s;
        cfg.reap_frequency = 0ms;
        return cfg;
    }

    struct SitePoolTest : ::testing::Test {
        std::shared_ptr<FakeTransport> transport =
            std::make_shared<FakeTransport>();

        std::shared_ptr<FakeSitePool> make(
            SharedCapacity& cap,
            RequestPoolConfiguration cfg = default_cfg()) {
            return std::make_shared<FakeSitePool>(make_site(), transport, cap,
                                                  cfg);
        }
    };

}  // namespace

TEST_F(SitePoolTest, CheckoutCreatesAndReusesIdle) {
    SharedCapacity cap(2);
    auto pool = make(cap);

    auto lease1 = pool->checkout();
    ASSERT_TRUE(lease1.has_value());
    auto conn1 = lease1.value().get();
    EXPECT_EQ(pool->size(), 1u);
    EXPECT_EQ(pool->idle_count(), 0u);
    EXPECT_EQ(cap.size(), 1u);

    lease1.value().reset();
    EXPECT_EQ(pool->idle_count(), 1u);

    auto lease2 = pool->checkout();
    ASSERT_TRUE(lease2.has_value());
    EXPECT_EQ(lease2.value().get(), conn1);
    EXPECT_EQ(transport->opens.load(), 1);
}

TEST_F(SitePoolTest, MostRecentlyReturnedIsHandedOutFirst) {
    SharedCapacity cap(2);
    auto pool = make(cap);

    auto a = pool->checkout();
    auto b = pool->checkout();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    auto conn_b = b.value().get();

    a.value().reset();
    b.value().reset();

    auto c = pool->checkout();
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c.value().get(), conn_b);
}

TEST_F(SitePoolTest, LeaseMoveSemantics) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    auto lease = pool->checkout();
    ASSERT_TRUE(lease.has_value());
    auto conn = lease.value().get();

    FakeSitePool::Lease moved = std::move(lease).value();
    EXPECT_EQ(moved.get(), conn);
    EXPECT_TRUE(static_cast<bool>(moved));

    FakeSitePool::Lease other;
    EXPECT_FALSE(static_cast<bool>(other));
    other = std::move(moved);
    EXPECT_EQ(other.get(), conn);
    EXPECT_EQ(pool->idle_count(), 0u);

    other.reset();
    EXPECT_FALSE(static_cast<bool>(other));
    EXPECT_EQ(pool->idle_count(), 1u);
}

TEST_F(SitePoolTest, DeadConnectionIsDiscardedOnCheckin) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    auto r = pool->with_connection(fatal_work);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, Error::Code::Timeout);

    EXPECT_EQ(pool->size(), 0u);
    EXPECT_EQ(pool->idle_count(), 0u);
    EXPECT_EQ(cap.size(), 0u);
    EXPECT_EQ(transport->closes.load(), 1);
}

TEST_F(SitePoolTest, WithConnectionReturnsConnectionToIdle) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    auto r = pool->with_connection(ok_work);
    ASSERT_TRUE(r);
    EXPECT_EQ(pool->idle_count(), 1u);
    EXPECT_EQ(cap.size(), 1u);
}

TEST_F(SitePoolTest, ThrowingWorkReleasesSlot) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    EXPECT_THROW(pool->with_connection([](FakeHandle&) -> Result<int> {
        throw std::runtime_error("work failed");
    }),
                 std::runtime_error);

    EXPECT_TRUE(pool->empty());
    EXPECT_EQ(cap.size(), 0u);
}

TEST_F(SitePoolTest, RemoveOnlySucceedsForIdle) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    auto lease = pool->checkout();
    ASSERT_TRUE(lease.has_value());
    auto conns = pool->connections();
    ASSERT_EQ(conns.size(), 1u);

    EXPECT_FALSE(pool->remove(conns[0]));
    EXPECT_EQ(cap.size(), 1u);

    lease.value().reset();
    EXPECT_TRUE(pool->remove(conns[0]));
    EXPECT_FALSE(pool->remove(conns[0]));
    EXPECT_TRUE(pool->empty());
    EXPECT_EQ(cap.size(), 0u);

    // The caller closes what it removed
    EXPECT_TRUE(conns[0]->has_handle());
    conns[0]->close();
}

TEST_F(SitePoolTest, CheckoutTimesOutWhenCapacityIsHeld) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    auto held = pool->checkout();
    ASSERT_TRUE(held.has_value());

    const auto start = clock_type::now();
    auto second = pool->checkout();
    const auto elapsed = clock_type::now() - start;

    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, Error::Code::PoolExhausted);
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 2s);
}

TEST_F(SitePoolTest, WaiterGetsConnectionCheckedIn) {
    SharedCapacity cap(1);
    auto cfg = default_cfg();
    cfg.wait_timeout = 5s;
    auto pool = make(cap, cfg);

    auto held = pool->checkout();
    ASSERT_TRUE(held.has_value());
    auto conn = held.value().get();

    std::thread returner([&] {
        std::this_thread::sleep_for(30ms);
        held.value().reset();
    });

    auto waited = pool->checkout();
    returner.join();

    ASSERT_TRUE(waited.has_value());
    EXPECT_EQ(waited.value().get(), conn);
    EXPECT_EQ(transport->opens.load(), 1);
}

TEST_F(SitePoolTest, WaiterWakesWhenAnotherPoolReleases) {
    SharedCapacity cap(1);
    auto cfg = default_cfg();
    cfg.wait_timeout = 5s;
    auto pool_a = make(cap, cfg);
    auto pool_b = std::make_shared<FakeSitePool>(make_site("b.example"),
                                                 transport, cap, cfg);

    ASSERT_TRUE(pool_a->with_connection(ok_work));
    auto idle = pool_a->connections();
    ASSERT_EQ(idle.size(), 1u);

    std::thread reaper([&] {
        std::this_thread::sleep_for(30ms);
        if (pool_a->remove(idle[0])) idle[0]->close();
    });

    auto lease = pool_b->checkout();
    reaper.join();

    ASSERT_TRUE(lease.has_value());
    EXPECT_EQ(lease.value()->site(), make_site("b.example"));
    EXPECT_EQ(cap.size(), 1u);
}

TEST_F(SitePoolTest, FailedOpenReleasesReservedSlot) {
    SharedCapacity cap(1);
    auto pool = make(cap);
    transport->fail_open = true;

    EXPECT_THROW((void)pool->checkout(), std::runtime_error);
    EXPECT_TRUE(pool->empty());
    EXPECT_EQ(cap.size(), 0u);

    transport->fail_open = false;
    EXPECT_TRUE(pool->checkout().has_value());
}

TEST_F(SitePoolTest, RetiredPoolRefusesCheckout) {
    SharedCapacity cap(1);
    auto pool = make(cap);

    {
        auto lease = pool->checkout();
        ASSERT_TRUE(lease.has_value());
        EXPECT_FALSE(pool->retire_if_empty());
    }

    auto conns = pool->connections();
    ASSERT_TRUE(pool->remove(conns[0]));
    conns[0]->close();

    EXPECT_TRUE(pool->retire_if_empty());
    EXPECT_TRUE(pool->retired());

    auto r = pool->checkout();
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, Error::Code::Shutdown);
}

TEST_F(SitePoolTest, DestructionReleasesHeldSlots) {
    SharedCapacity cap(2);
    {
        auto pool = make(cap);
        ASSERT_TRUE(pool->with_connection(ok_work));
        EXPECT_EQ(cap.size(), 1u);
    }
    EXPECT_EQ(cap.size(), 0u);
    EXPECT_EQ(transport->live.load(), 0);
}
