#pragma once

#include <type_traits>

#include "ocipush/core/types.hpp"

namespace ocipush::core {
    struct BufferView {
        const u8* data{nullptr};
        u64 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u64 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace ocipush::core
