#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>

#include "ocipush/stream/chunk.hpp"

namespace ocipush::stream {

    enum class PopResult : u8 {
        Chunk = 0,   // *out holds the next chunk
        Closed,      // producer finished and every chunk was taken
        Stopped,     // stop was requested
    };

    // Bounded FIFO between the chunk producer and the consumer.
    //
    // The producer reserves a slot before it reads a chunk and fills it with
    // push(), so queued chunks plus the one being read never exceed
    // capacity(). Waits observe a stop_token, so requesting stop wakes a
    // producer blocked on a full queue and a consumer blocked on an empty one.
    class ChunkQueue {
    public:
        // A capacity of 0 is raised to 1.
        explicit ChunkQueue(u32 capacity) noexcept : capacity_(capacity == 0 ? 1 : capacity) {}

        ChunkQueue(const ChunkQueue&) = delete;
        ChunkQueue& operator=(const ChunkQueue&) = delete;

        // Blocks until a slot is free. False if stop was requested or the
        // queue is closed.
        [[nodiscard]] bool reserve(std::stop_token stop);

        // Gives back a reservation that will not be filled.
        void unreserve() noexcept;

        // Fills a slot taken with reserve(); never blocks. Returns false,
        // leaving chunk untouched, if the queue is closed or nothing was
        // reserved.
        [[nodiscard]] bool push(Chunk&& chunk);

        [[nodiscard]] PopResult pop(Chunk* out, std::stop_token stop);

        // No further pushes; pop() returns Closed once the queue is empty.
        void close() noexcept;

        // Discards every queued chunk. Returns how many were dropped.
        u32 drain() noexcept;

        [[nodiscard]] u32 capacity() const noexcept { return capacity_; }
        [[nodiscard]] u32 size() const noexcept;

        // Most slots ever in use at once, queued and reserved together.
        [[nodiscard]] u32 high_water() const noexcept;

    private:
        const u32 capacity_;
        mutable std::mutex mu_;
        std::condition_variable_any not_full_;
        std::condition_variable_any not_empty_;
        std::deque<Chunk> items_;
        u32 reserved_{0};
        u32 high_water_{0};
        bool closed_{false};
    };

} // namespace ocipush::stream
