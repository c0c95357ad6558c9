#pragma once

#include <functional>
#include <stop_token>

#include "ocipush/core/errors.hpp"
#include "ocipush/stream/byte_source.hpp"
#include "ocipush/stream/chunk.hpp"

namespace ocipush::stream {

    struct TransferOptions {
        u64 chunk_size{0};      // Bytes per chunk; every chunk but the last is exactly this long
        u32 queue_capacity{1};  // Chunks read ahead of the callback, counting one being read (0 behaves as 1)
    };

    struct TransferStats {
        u64 chunks{0};               // Chunks handed to the callback
        u64 bytes{0};                // Bytes handed to the callback
        i64 last_byte{-1};           // last_byte of the final delivered chunk, -1 if none
        u32 max_queued{0};           // Most chunks held ahead of the callback at once
        u32 discarded{0};            // Chunks read but dropped during teardown
        bool producer_exited{false}; // Producer thread finished before the call returned
    };

    // Invoked once per chunk, in part order, never concurrently with itself.
    // Must not throw. A non-Ok return aborts the transfer.
    using ChunkCallback = std::function<ocipush::core::Status(const Chunk&)>;

    // Splits source into chunks on a producer thread and runs on_chunk for each
    // on the calling thread.
    //
    // *bytes_out receives the number of bytes delivered to on_chunk, or 0 on
    // failure. The first error wins: a source read error, the callback's own
    // status, or Canceled when cancel fires. Before returning, on every path,
    // the producer is stopped and joined and undelivered chunks are dropped.
    // source.cancel() is called on abort so a producer blocked in read wakes.
    [[nodiscard]] ocipush::core::Status chunked_transfer(ByteSource& source,
        const TransferOptions& opts,
        const ChunkCallback& on_chunk,
        u64* bytes_out,
        TransferStats* stats = nullptr,
        std::stop_token cancel = {}) noexcept;

} // namespace ocipush::stream
