#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunkpipe/transfer/slot_pool.hpp"

using namespace chunkpipe::core;
using chunkpipe::transfer::SlotLease;
using chunkpipe::transfer::SlotPool;

TEST(SlotPool, LeaseReleasesOnDestruction) {
    SlotPool pool(2);
    {
        SlotLease a;
        ASSERT_TRUE(is_ok(pool.acquire(&a)));
        EXPECT_TRUE(a.held());
        EXPECT_EQ(pool.in_use(), 1u);
    }
    EXPECT_EQ(pool.in_use(), 0u);
    EXPECT_EQ(pool.peak(), 1u);
}

TEST(SlotPool, TryAcquireFailsWhenFull) {
    SlotPool pool(1);
    SlotLease a;
    SlotLease b;
    ASSERT_TRUE(pool.try_acquire(&a));
    EXPECT_FALSE(pool.try_acquire(&b));
    EXPECT_FALSE(b.held());
    a.release();
    EXPECT_FALSE(a.held());
    EXPECT_TRUE(pool.try_acquire(&b));
}

TEST(SlotPool, MovedLeaseKeepsSingleSlot) {
    SlotPool pool(2);
    SlotLease a;
    ASSERT_TRUE(is_ok(pool.acquire(&a)));
    SlotLease b(std::move(a));
    EXPECT_FALSE(a.held());
    EXPECT_TRUE(b.held());
    EXPECT_EQ(pool.in_use(), 1u);

    SlotLease c;
    ASSERT_TRUE(is_ok(pool.acquire(&c)));
    c = std::move(b);
    EXPECT_EQ(pool.in_use(), 1u);
}

TEST(SlotPool, AcquireBlocksUntilRelease) {
    SlotPool pool(1);
    SlotLease first;
    ASSERT_TRUE(is_ok(pool.acquire(&first)));

    std::atomic<bool> got{false};
    std::thread waiter([&] {
        SlotLease second;
        EXPECT_TRUE(is_ok(pool.acquire(&second)));
        got = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(got.load());
    first.release();
    waiter.join();
    EXPECT_TRUE(got.load());
    EXPECT_EQ(pool.peak(), 1u);
}

TEST(SlotPool, CancelWakesBlockedAcquire) {
    SlotPool pool(1);
    SlotLease held;
    ASSERT_TRUE(is_ok(pool.acquire(&held)));

    Status result{};
    std::thread waiter([&] {
        SlotLease lease;
        result = pool.acquire(&lease);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    pool.cancel();
    waiter.join();
    EXPECT_EQ(result.code, StatusCode::Cancelled);
    EXPECT_TRUE(pool.cancelled());

    SlotLease late;
    EXPECT_FALSE(pool.try_acquire(&late));
}

TEST(SlotPool, ZeroCapacityIsInvalid) {
    SlotPool pool(0);
    SlotLease lease;
    EXPECT_EQ(pool.acquire(&lease).code, StatusCode::Invalid);
}

TEST(SlotPool, NeverExceedsCapacityUnderContention) {
    SlotPool pool(3);
    std::atomic<u32> inside{0};
    std::atomic<u32> worst{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                SlotLease lease;
                ASSERT_TRUE(is_ok(pool.acquire(&lease)));
                const u32 now = ++inside;
                u32 prev = worst.load();
                while (now > prev && !worst.compare_exchange_weak(prev, now)) {
                }
                std::this_thread::yield();
                --inside;
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_LE(worst.load(), 3u);
    EXPECT_LE(pool.peak(), 3u);
    EXPECT_EQ(pool.in_use(), 0u);
}
