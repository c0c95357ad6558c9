#pragma once

#include <string>

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/errors.hpp"
#include "ocipush/digest/digest.hpp"
#include "ocipush/registry/descriptor.hpp"
#include "ocipush/registry/image_store.hpp"
#include "ocipush/registry/status_tracker.hpp"

namespace ocipush::registry {

    // Buffers a manifest in memory and stores it with put_manifest on commit.
    class ManifestWriter {
    public:
        ManifestWriter() noexcept = default;

        ManifestWriter(const ManifestWriter&) = delete;
        ManifestWriter& operator=(const ManifestWriter&) = delete;

        // tag may be empty for a digest-only push. store and tracker must
        // outlive the writer.
        [[nodiscard]] ocipush::core::Status open(ImageStore& store,
            const Repository& repo,
            const std::string& tag,
            const Descriptor& desc,
            StatusTracker& tracker) noexcept;

        [[nodiscard]] ocipush::core::Status write(ocipush::core::BufferView data, u64* written) noexcept;

        // expected_size of 0 skips the size check. A failed commit marks the
        // status record Failed; the buffered manifest is kept for a retry.
        [[nodiscard]] ocipush::core::Status commit(u64 expected_size, const ocipush::digest::Digest& expected) noexcept;

        [[nodiscard]] ocipush::core::Status status(TransferStatus* out) const;

        [[nodiscard]] ocipush::core::Status close() noexcept;
        [[nodiscard]] ocipush::core::Status truncate(u64 size) noexcept;

        [[nodiscard]] const std::string& ref() const noexcept { return ref_; }
        [[nodiscard]] u64 buffered() const noexcept { return static_cast<u64>(buf_.size()); }

    private:
        void mark(TransferState state) noexcept;

        ImageStore* store_{nullptr};
        StatusTracker* tracker_{nullptr};
        Repository repo_;
        std::string tag_;
        std::string ref_;
        std::string buf_;
        bool open_{false};
    };

} // namespace ocipush::registry
