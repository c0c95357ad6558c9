#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>

namespace ocipush::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Unix epoch milliseconds.
    using Timestamp = i64;

    [[nodiscard]] Timestamp now_millis() noexcept;

    // Inclusive byte range of one part within a stream.
    struct ByteRange {
        u64 first{0};
        u64 last{0};

        [[nodiscard]] constexpr u64 length() const noexcept { return last - first + 1; }
        friend constexpr bool operator==(ByteRange, ByteRange) noexcept = default;
    };

    static_assert(std::is_trivially_copyable_v<ByteRange>);
    static_assert(std::is_standard_layout_v<ByteRange>);

} // namespace ocipush::core
