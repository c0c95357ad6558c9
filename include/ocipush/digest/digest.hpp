#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "ocipush/core/buffer.hpp"
#include "ocipush/core/errors.hpp"
#include "ocipush/core/types.hpp"

namespace ocipush::digest {
    using u8 = ocipush::core::u8;
    using u32 = ocipush::core::u32;
    using u64 = ocipush::core::u64;

    enum class DigestAlgorithm : u8 {
        Unknown = 0,
        Sha256,
        Sha512,
        Blake3,
    };

    // Content digest in OCI form: "<algorithm>:<lowercase hex>".
    struct Digest {
        DigestAlgorithm algorithm{DigestAlgorithm::Unknown};
        std::string encoded;

        [[nodiscard]] bool empty() const noexcept { return algorithm == DigestAlgorithm::Unknown || encoded.empty(); }
        [[nodiscard]] std::string str() const;

        friend bool operator==(const Digest&, const Digest&) = default;
    };

    [[nodiscard]] const char* algorithm_name(DigestAlgorithm alg) noexcept;

    // Hex characters in an encoded digest of this algorithm, 0 for Unknown.
    [[nodiscard]] u32 algorithm_hex_len(DigestAlgorithm alg) noexcept;

    // False when the backing library was not found at build time.
    [[nodiscard]] bool algorithm_available(DigestAlgorithm alg) noexcept;

    [[nodiscard]] ocipush::core::Status algorithm_parse(std::string_view name, DigestAlgorithm* out) noexcept;

    // Parses "sha256:<64 hex>", "sha512:<128 hex>" or "blake3:<64 hex>".
    [[nodiscard]] ocipush::core::Status digest_parse(std::string_view s, Digest* out) noexcept;

    [[nodiscard]] ocipush::core::Status digest_compute(DigestAlgorithm alg,
        ocipush::core::BufferView data,
        Digest* out) noexcept;

    // Incremental digest over a stream of writes.
    class Digester {
    public:
        Digester() noexcept;
        ~Digester() noexcept;

        Digester(const Digester&) = delete;
        Digester& operator=(const Digester&) = delete;

        [[nodiscard]] ocipush::core::Status init(DigestAlgorithm alg) noexcept;
        [[nodiscard]] ocipush::core::Status update(ocipush::core::BufferView data) noexcept;

        // Produces the digest; the digester must be re-initialised before reuse.
        [[nodiscard]] ocipush::core::Status finish(Digest* out) noexcept;

        [[nodiscard]] DigestAlgorithm algorithm() const noexcept { return alg_; }
        [[nodiscard]] u64 bytes() const noexcept { return bytes_; }

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
        DigestAlgorithm alg_{DigestAlgorithm::Unknown};
        u64 bytes_{0};
    };

} // namespace ocipush::digest
