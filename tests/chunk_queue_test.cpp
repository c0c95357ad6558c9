#include <chrono>
#include <thread>
#include <utility>

#include <gtest/gtest.h>

#include "ocipush/stream/chunk_queue.hpp"

using namespace ocipush::stream;

static Chunk make_chunk(u64 part) {
    Chunk c;
    c.bytes.assign(4, static_cast<u8>(part));
    c.part = part;
    c.first_byte = (part - 1) * 4;
    c.last_byte = c.first_byte + 3;
    return c;
}

TEST(StreamChunkQueue, ZeroCapacityBehavesAsOne) {
    ChunkQueue q(0);
    EXPECT_EQ(q.capacity(), 1u);
}

static bool reserve_and_push(ChunkQueue& q, u64 part, std::stop_token stop = {}) {
    return q.reserve(stop) && q.push(make_chunk(part));
}

TEST(StreamChunkQueue, FifoThenClosed) {
    ChunkQueue q(3);
    std::stop_source stop;
    ASSERT_TRUE(reserve_and_push(q, 1, stop.get_token()));
    ASSERT_TRUE(reserve_and_push(q, 2, stop.get_token()));
    q.close();

    Chunk out;
    EXPECT_EQ(q.pop(&out, stop.get_token()), PopResult::Chunk);
    EXPECT_EQ(out.part, 1u);
    EXPECT_EQ(q.pop(&out, stop.get_token()), PopResult::Chunk);
    EXPECT_EQ(out.part, 2u);
    EXPECT_EQ(q.pop(&out, stop.get_token()), PopResult::Closed);
    EXPECT_EQ(q.high_water(), 2u);
}

TEST(StreamChunkQueue, ReserveAfterCloseFails) {
    ChunkQueue q(2);
    q.close();
    EXPECT_FALSE(q.reserve(std::stop_token{}));
    EXPECT_EQ(q.size(), 0u);
}

TEST(StreamChunkQueue, PushWithoutReservationFails) {
    ChunkQueue q(2);
    Chunk c = make_chunk(1);
    EXPECT_FALSE(q.push(std::move(c)));
    EXPECT_EQ(c.part, 1u);
    EXPECT_EQ(q.size(), 0u);
}

TEST(StreamChunkQueue, ReservationCountsAgainstCapacity) {
    ChunkQueue q(2);
    ASSERT_TRUE(reserve_and_push(q, 1));
    ASSERT_TRUE(q.reserve(std::stop_token{}));
    EXPECT_EQ(q.size(), 1u);
    EXPECT_EQ(q.high_water(), 2u);

    // Queue holds one chunk and one slot is reserved, so another reserve waits.
    std::stop_source stop;
    bool reserved = true;
    std::thread producer([&] { reserved = q.reserve(stop.get_token()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stop.request_stop();
    producer.join();
    EXPECT_FALSE(reserved);

    q.unreserve();
    EXPECT_TRUE(q.reserve(std::stop_token{}));
}

TEST(StreamChunkQueue, PopFreesSlotForWaitingReserve) {
    ChunkQueue q(1);
    ASSERT_TRUE(reserve_and_push(q, 1));

    bool reserved = false;
    std::thread producer([&] { reserved = q.reserve(std::stop_token{}); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));

    Chunk out;
    EXPECT_EQ(q.pop(&out, std::stop_token{}), PopResult::Chunk);
    producer.join();
    EXPECT_TRUE(reserved);
    EXPECT_EQ(q.high_water(), 1u);
}

TEST(StreamChunkQueue, StopWakesBlockedReserve) {
    ChunkQueue q(1);
    std::stop_source stop;
    ASSERT_TRUE(reserve_and_push(q, 1, stop.get_token()));

    bool reserved = true;
    std::thread producer([&] { reserved = q.reserve(stop.get_token()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stop.request_stop();
    producer.join();

    EXPECT_FALSE(reserved);
    EXPECT_EQ(q.size(), 1u);
}

TEST(StreamChunkQueue, StopWakesBlockedPop) {
    ChunkQueue q(1);
    std::stop_source stop;

    PopResult r = PopResult::Chunk;
    std::thread consumer([&] {
        Chunk out;
        r = q.pop(&out, stop.get_token());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    stop.request_stop();
    consumer.join();

    EXPECT_EQ(r, PopResult::Stopped);
}

TEST(StreamChunkQueue, DrainDropsEverything) {
    ChunkQueue q(4);
    ASSERT_TRUE(reserve_and_push(q, 1));
    ASSERT_TRUE(reserve_and_push(q, 2));
    ASSERT_TRUE(reserve_and_push(q, 3));
    EXPECT_EQ(q.drain(), 3u);
    EXPECT_EQ(q.size(), 0u);
}
