#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/config.hpp"
#include "ocipush/core/errors.hpp"
#include "ocipush/digest/digest.hpp"
#include "ocipush/registry/descriptor.hpp"
#include "ocipush/registry/image_store.hpp"
#include "ocipush/registry/status_tracker.hpp"
#include "ocipush/stream/byte_pipe.hpp"
#include "ocipush/stream/chunk.hpp"

namespace ocipush::registry {

    // Streams one blob to the store as a multi-part upload.
    //
    // open() initiates the upload and starts a background chunked transfer
    // that reads what write() pushes through a bounded pipe and uploads one
    // part per chunk. write() blocks when the pipe and the chunk queue are
    // full. commit() ends the stream, waits for the last part and completes
    // the upload. A writer that is destroyed while open aborts the upload.
    //
    // write() and commit() are meant for one thread; status() may be called
    // from any thread.
    class LayerWriter {
    public:
        LayerWriter() noexcept;
        ~LayerWriter() noexcept;

        LayerWriter(const LayerWriter&) = delete;
        LayerWriter& operator=(const LayerWriter&) = delete;

        // store and tracker must outlive the writer.
        [[nodiscard]] ocipush::core::Status open(ImageStore& store,
            const Repository& repo,
            const Descriptor& desc,
            StatusTracker& tracker,
            const ocipush::core::UploadConfig& cfg = {}) noexcept;

        // Fails fast with the background error once the upload has failed.
        [[nodiscard]] ocipush::core::Status write(ocipush::core::BufferView data, u64* written) noexcept;

        // expected_size of 0 skips the size check. Canceling cancel aborts
        // the upload and returns Canceled without waiting for a part upload
        // that is already in flight.
        [[nodiscard]] ocipush::core::Status commit(u64 expected_size,
            const ocipush::digest::Digest& expected,
            std::stop_token cancel = {}) noexcept;

        [[nodiscard]] ocipush::core::Status status(TransferStatus* out) const;

        // Not supported by multi-part uploads; always Unsupported.
        [[nodiscard]] ocipush::core::Status close() noexcept;
        [[nodiscard]] ocipush::core::Status truncate(u64 size) noexcept;

        // Stops the background transfer, fails pending writes and marks the
        // status record Failed. Does not wait for an in-flight part upload.
        void abort() noexcept;

        [[nodiscard]] const std::string& ref() const noexcept { return ref_; }
        [[nodiscard]] const std::string& upload_id() const noexcept { return session_.upload_id; }
        [[nodiscard]] u64 part_size() const noexcept { return session_.part_size; }

    private:
        enum class Phase : u8 {
            Idle = 0,
            Open,
            Closed,
        };

        void run_transfer(std::stop_token stop) noexcept;
        [[nodiscard]] ocipush::core::Status upload_chunk(const ocipush::stream::Chunk& chunk) noexcept;
        [[nodiscard]] ocipush::core::Status complete(u64 expected_size, const ocipush::digest::Digest& expected) noexcept;
        void mark(TransferState state) noexcept;

        ImageStore* store_{nullptr};
        StatusTracker* tracker_{nullptr};
        Repository repo_;
        std::string ref_;
        ocipush::core::UploadConfig cfg_{};
        UploadSession session_;
        Phase phase_{Phase::Idle};

        std::unique_ptr<ocipush::stream::BytePipe> pipe_;
        ocipush::digest::Digester digester_;
        bool digesting_{false};

        mutable std::mutex mu_;
        std::condition_variable_any done_cv_;
        bool done_{false};
        ocipush::core::Status result_{};
        u64 transferred_{0};

        // Declared last so it is joined before anything it touches goes away.
        std::jthread worker_;
    };

} // namespace ocipush::registry
