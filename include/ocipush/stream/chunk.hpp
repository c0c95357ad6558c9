#pragma once

#include <chrono>
#include <vector>

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/types.hpp"

namespace ocipush::stream {
    using u8 = ocipush::core::u8;
    using u32 = ocipush::core::u32;
    using u64 = ocipush::core::u64;
    using i64 = ocipush::core::i64;

    // One part of a byte stream.
    //
    // bytes is allocated fresh for every chunk and owned by the transfer
    // engine. A callback sees the chunk only for the duration of the call and
    // must copy anything it wants to keep.
    struct Chunk {
        std::vector<u8> bytes;
        u64 part{0};                          // 1-based
        u64 first_byte{0};                    // inclusive
        u64 last_byte{0};                     // inclusive
        std::chrono::nanoseconds read_time{0};

        [[nodiscard]] u64 size() const noexcept { return static_cast<u64>(bytes.size()); }

        [[nodiscard]] ocipush::core::BufferView view() const noexcept {
            return ocipush::core::BufferView{bytes.data(), static_cast<u64>(bytes.size())};
        }

        [[nodiscard]] ocipush::core::ByteRange range() const noexcept {
            return ocipush::core::ByteRange{first_byte, last_byte};
        }
    };
} // namespace ocipush::stream
