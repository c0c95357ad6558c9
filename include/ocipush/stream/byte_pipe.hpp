#pragma once

#include <condition_variable>
#include <mutex>
#include <vector>

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/errors.hpp"
#include "ocipush/stream/byte_source.hpp"

namespace ocipush::stream {

    // Bounded in-process byte channel between one writer and one reader.
    //
    // Holds at most capacity() bytes. write() blocks while the buffer is full,
    // read() blocks while it is empty. Closing the write side delivers end of
    // stream (or an error) to the reader once the buffered bytes are consumed;
    // closing the read side fails pending and later writes with the reason.
    class BytePipe {
    public:
        // A capacity of 0 is raised to 1.
        explicit BytePipe(u64 capacity);

        BytePipe(const BytePipe&) = delete;
        BytePipe& operator=(const BytePipe&) = delete;

        // Blocks until all of data is buffered. *written holds the bytes
        // accepted, also on failure.
        [[nodiscard]] ocipush::core::Status write(ocipush::core::BufferView data, u64* written) noexcept;

        [[nodiscard]] ocipush::core::Status read(u8* dst, u64 cap, u64* n) noexcept;

        void close_write() noexcept;
        void close_write(ocipush::core::Status reason) noexcept;

        // An Ok reason is recorded as Canceled.
        void close_read(ocipush::core::Status reason) noexcept;

        [[nodiscard]] u64 capacity() const noexcept { return static_cast<u64>(ring_.size()); }
        [[nodiscard]] u64 buffered() const noexcept;

        // Read end as a ByteSource; cancel() closes the read side.
        [[nodiscard]] ByteSource& reader() noexcept { return reader_; }

    private:
        class Reader final : public ByteSource {
        public:
            explicit Reader(BytePipe* pipe) noexcept : pipe_(pipe) {}

            [[nodiscard]] ocipush::core::Status read(u8* dst, u64 cap, u64* n) noexcept override {
                return pipe_->read(dst, cap, n);
            }

            void cancel(ocipush::core::Status reason) noexcept override { pipe_->close_read(reason); }

        private:
            BytePipe* pipe_;
        };

        mutable std::mutex mu_;
        std::condition_variable readable_;
        std::condition_variable writable_;
        std::vector<u8> ring_;
        u64 head_{0};
        u64 size_{0};
        bool write_closed_{false};
        bool read_closed_{false};
        ocipush::core::Status write_reason_{};
        ocipush::core::Status read_reason_{};
        Reader reader_{this};
    };

} // namespace ocipush::stream
