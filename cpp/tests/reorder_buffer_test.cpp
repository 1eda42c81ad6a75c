#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunkpipe/stream/reorder_buffer.hpp"

using namespace chunkpipe::core;
using chunkpipe::stream::ReorderBuffer;

namespace {
    TransferResult result_for(u64 index) {
        TransferResult r;
        r.index = index;
        r.size = index * 10;
        r.state = ChunkState::Downloaded;
        return r;
    }
} // namespace

TEST(ReorderBuffer, ReleasesInIndexOrder) {
    ReorderBuffer buf;
    for (u64 i : {3ull, 0ull, 2ull, 1ull}) {
        buf.push(result_for(i));
    }
    for (u64 i = 0; i < 4; ++i) {
        TransferResult r;
        ASSERT_TRUE(buf.wait_next(&r));
        EXPECT_EQ(r.index, i);
        EXPECT_EQ(r.size, i * 10);
    }
    EXPECT_EQ(buf.next_index(), 4u);
    EXPECT_EQ(buf.pending(), 0u);
}

TEST(ReorderBuffer, WaitsForMissingIndex) {
    ReorderBuffer buf;
    buf.push(result_for(1));
    buf.push(result_for(2));
    EXPECT_EQ(buf.pending(), 2u);

    std::vector<u64> seen;
    std::thread consumer([&] {
        for (int i = 0; i < 3; ++i) {
            TransferResult r;
            if (!buf.wait_next(&r)) return;
            seen.push_back(r.index);
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    buf.push(result_for(0));
    consumer.join();
    EXPECT_EQ(seen, (std::vector<u64>{0, 1, 2}));
}

TEST(ReorderBuffer, CancelUnblocksConsumerAndDrainReturnsRest) {
    ReorderBuffer buf;
    buf.push(result_for(5));
    buf.push(result_for(4));

    bool returned = true;
    std::thread consumer([&] {
        TransferResult r;
        returned = buf.wait_next(&r);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    buf.cancel();
    consumer.join();
    EXPECT_FALSE(returned);

    const auto rest = buf.drain();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest[0].index, 4u);
    EXPECT_EQ(rest[1].index, 5u);
    EXPECT_EQ(buf.pending(), 0u);
}

TEST(ReorderBuffer, ConcurrentProducers) {
    ReorderBuffer buf;
    std::vector<std::thread> producers;
    for (u64 t = 0; t < 4; ++t) {
        producers.emplace_back([&buf, t] {
            for (u64 i = t; i < 200; i += 4) {
                buf.push(result_for(i));
            }
        });
    }
    for (u64 i = 0; i < 200; ++i) {
        TransferResult r;
        ASSERT_TRUE(buf.wait_next(&r));
        ASSERT_EQ(r.index, i);
    }
    for (auto& th : producers) {
        th.join();
    }
}
