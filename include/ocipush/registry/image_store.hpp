#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/errors.hpp"
#include "ocipush/core/types.hpp"
#include "ocipush/digest/digest.hpp"
#include "ocipush/registry/descriptor.hpp"

namespace ocipush::registry {

    struct UploadSession {
        std::string upload_id;
        u64 part_size{0};       // Store-recommended bytes per part
    };

    // Client for the registry's native control-plane API.
    //
    // Implementations report failures as Status values. complete_upload must
    // use StatusCode::AlreadyExists when the blob is already present, and
    // upload_part may be called from a thread other than the one that called
    // initiate_upload (never concurrently for one upload).
    class ImageStore {
    public:
        virtual ~ImageStore() = default;

        [[nodiscard]] virtual ocipush::core::Status initiate_upload(const Repository& repo,
            UploadSession* out) noexcept = 0;

        [[nodiscard]] virtual ocipush::core::Status upload_part(const Repository& repo,
            const std::string& upload_id,
            ocipush::core::ByteRange range,
            ocipush::core::BufferView part) noexcept = 0;

        // *actual receives the digest the store computed over the uploaded parts.
        [[nodiscard]] virtual ocipush::core::Status complete_upload(const Repository& repo,
            const std::string& upload_id,
            const std::vector<ocipush::digest::Digest>& digests,
            ocipush::digest::Digest* actual) noexcept = 0;

        [[nodiscard]] virtual ocipush::core::Status put_manifest(const Repository& repo,
            const std::string& tag,
            std::string_view manifest,
            ocipush::digest::Digest* actual) noexcept = 0;

        // Algorithm the store checks client digests against on
        // complete_upload. An AlreadyExists answer is only trusted for
        // digests in this algorithm.
        [[nodiscard]] virtual ocipush::digest::DigestAlgorithm validated_algorithm() const noexcept {
            return ocipush::digest::DigestAlgorithm::Sha256;
        }
    };

} // namespace ocipush::registry
