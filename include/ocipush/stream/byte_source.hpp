#pragma once

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/errors.hpp"
#include "ocipush/core/types.hpp"

namespace ocipush::stream {
    using u8 = ocipush::core::u8;
    using u64 = ocipush::core::u64;

    // Sequential pull-style reader.
    class ByteSource {
    public:
        virtual ~ByteSource() = default;

        // Reads up to cap bytes into dst, blocking until at least one byte is
        // available. Ok with *n == 0 means end of stream.
        [[nodiscard]] virtual ocipush::core::Status read(u8* dst, u64 cap, u64* n) noexcept = 0;

        // Unblocks a pending read from another thread. Later reads fail with
        // reason. Sources that never block may ignore it.
        virtual void cancel(ocipush::core::Status reason) noexcept { (void)reason; }
    };

    // Reads from caller-owned memory.
    class MemorySource final : public ByteSource {
    public:
        explicit MemorySource(ocipush::core::BufferView data) noexcept : data_(data) {}

        [[nodiscard]] ocipush::core::Status read(u8* dst, u64 cap, u64* n) noexcept override;

        [[nodiscard]] u64 remaining() const noexcept { return data_.len - pos_; }

    private:
        ocipush::core::BufferView data_{};
        u64 pos_{0};
    };
} // namespace ocipush::stream
