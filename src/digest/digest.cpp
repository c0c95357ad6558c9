#include "ocipush/digest/digest.hpp"

#include <array>
#include <cstddef>
#include <new>
#include <utility>

#include <openssl/evp.h>

#if defined(OCIPUSH_HAVE_BLAKE3)
#include <blake3.h>
#endif

namespace ocipush::digest {

using ocipush::core::BufferView;
using ocipush::core::Status;
using ocipush::core::StatusCode;
using ocipush::core::StatusDomain;
using ocipush::core::make_status;
using ocipush::core::ok_status;

namespace {
    constexpr u32 kMaxDigestBytes = 64;

    [[nodiscard]] Status digest_status(StatusCode code) noexcept {
        return make_status(StatusDomain::Digest, code);
    }

    [[nodiscard]] bool is_lower_hex(char c) noexcept {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    }

    void to_hex(const u8* bytes, u32 len, std::string* out) {
        static const char hex[] = "0123456789abcdef";
        out->resize(static_cast<size_t>(len) * 2);
        for (u32 i = 0; i < len; ++i) {
            (*out)[2 * i] = hex[(bytes[i] >> 4) & 0xF];
            (*out)[2 * i + 1] = hex[bytes[i] & 0xF];
        }
    }

    [[nodiscard]] const EVP_MD* evp_for(DigestAlgorithm alg) noexcept {
        switch (alg) {
        case DigestAlgorithm::Sha256: return EVP_sha256();
        case DigestAlgorithm::Sha512: return EVP_sha512();
        default: return nullptr;
        }
    }
} // namespace

std::string Digest::str() const {
    std::string out = algorithm_name(algorithm);
    out.push_back(':');
    out.append(encoded);
    return out;
}

const char* algorithm_name(DigestAlgorithm alg) noexcept {
    switch (alg) {
    case DigestAlgorithm::Sha256: return "sha256";
    case DigestAlgorithm::Sha512: return "sha512";
    case DigestAlgorithm::Blake3: return "blake3";
    case DigestAlgorithm::Unknown: break;
    }
    return "unknown";
}

u32 algorithm_hex_len(DigestAlgorithm alg) noexcept {
    switch (alg) {
    case DigestAlgorithm::Sha256: return 64;
    case DigestAlgorithm::Sha512: return 128;
    case DigestAlgorithm::Blake3: return 64;
    case DigestAlgorithm::Unknown: break;
    }
    return 0;
}

bool algorithm_available(DigestAlgorithm alg) noexcept {
    switch (alg) {
    case DigestAlgorithm::Sha256:
    case DigestAlgorithm::Sha512:
        return true;
    case DigestAlgorithm::Blake3:
#if defined(OCIPUSH_HAVE_BLAKE3)
        return true;
#else
        return false;
#endif
    case DigestAlgorithm::Unknown:
        break;
    }
    return false;
}

Status algorithm_parse(std::string_view name, DigestAlgorithm* out) noexcept {
    if (out == nullptr) {
        return digest_status(StatusCode::Invalid);
    }
    if (name == "sha256") {
        *out = DigestAlgorithm::Sha256;
    } else if (name == "sha512") {
        *out = DigestAlgorithm::Sha512;
    } else if (name == "blake3") {
        *out = DigestAlgorithm::Blake3;
    } else {
        return digest_status(StatusCode::Unsupported);
    }
    return ok_status();
}

Status digest_parse(std::string_view s, Digest* out) noexcept {
    if (out == nullptr) {
        return digest_status(StatusCode::Invalid);
    }

    const size_t colon = s.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return digest_status(StatusCode::Invalid);
    }

    DigestAlgorithm alg = DigestAlgorithm::Unknown;
    const Status as = algorithm_parse(s.substr(0, colon), &alg);
    if (!ocipush::core::is_ok(as)) {
        return as;
    }

    const std::string_view hex = s.substr(colon + 1);
    if (hex.size() != algorithm_hex_len(alg)) {
        return digest_status(StatusCode::Invalid);
    }
    for (char c : hex) {
        if (!is_lower_hex(c)) {
            return digest_status(StatusCode::Invalid);
        }
    }

    out->algorithm = alg;
    out->encoded.assign(hex.data(), hex.size());
    return ok_status();
}

Status digest_compute(DigestAlgorithm alg, BufferView data, Digest* out) noexcept {
    if (out == nullptr || !ocipush::core::buffer_ok(data)) {
        return digest_status(StatusCode::Invalid);
    }
    Digester d;
    Status s = d.init(alg);
    if (!ocipush::core::is_ok(s)) {
        return s;
    }
    s = d.update(data);
    if (!ocipush::core::is_ok(s)) {
        return s;
    }
    return d.finish(out);
}

// ========================================================================
// Digester
// ========================================================================

struct Digester::Impl {
    EVP_MD_CTX* md{nullptr};
#if defined(OCIPUSH_HAVE_BLAKE3)
    blake3_hasher blake3{};
#endif

    ~Impl() {
        if (md != nullptr) {
            EVP_MD_CTX_free(md);
        }
    }
};

Digester::Digester() noexcept = default;
Digester::~Digester() noexcept = default;

Status Digester::init(DigestAlgorithm alg) noexcept {
    impl_.reset();
    alg_ = DigestAlgorithm::Unknown;
    bytes_ = 0;

    if (alg == DigestAlgorithm::Unknown) {
        return digest_status(StatusCode::Invalid);
    }
    if (!algorithm_available(alg)) {
        return digest_status(StatusCode::Unavailable);
    }

    std::unique_ptr<Impl> impl;
    try {
        impl = std::make_unique<Impl>();
    } catch (const std::bad_alloc&) {
        return digest_status(StatusCode::Unavailable);
    }

    if (alg == DigestAlgorithm::Blake3) {
#if defined(OCIPUSH_HAVE_BLAKE3)
        blake3_hasher_init(&impl->blake3);
#endif
    } else {
        impl->md = EVP_MD_CTX_new();
        if (impl->md == nullptr) {
            return digest_status(StatusCode::Unavailable);
        }
        if (EVP_DigestInit_ex(impl->md, evp_for(alg), nullptr) != 1) {
            return digest_status(StatusCode::Crypto);
        }
    }

    impl_ = std::move(impl);
    alg_ = alg;
    return ok_status();
}

Status Digester::update(BufferView data) noexcept {
    if (!impl_ || !ocipush::core::buffer_ok(data)) {
        return digest_status(StatusCode::Invalid);
    }
    if (data.len == 0) {
        return ok_status();
    }

    if (alg_ == DigestAlgorithm::Blake3) {
#if defined(OCIPUSH_HAVE_BLAKE3)
        blake3_hasher_update(&impl_->blake3, data.data, static_cast<size_t>(data.len));
#endif
    } else if (EVP_DigestUpdate(impl_->md, data.data, static_cast<size_t>(data.len)) != 1) {
        return digest_status(StatusCode::Crypto);
    }

    bytes_ += data.len;
    return ok_status();
}

Status Digester::finish(Digest* out) noexcept {
    if (out == nullptr || !impl_) {
        return digest_status(StatusCode::Invalid);
    }

    std::array<u8, kMaxDigestBytes> raw{};
    u32 raw_len = 0;

    if (alg_ == DigestAlgorithm::Blake3) {
#if defined(OCIPUSH_HAVE_BLAKE3)
        blake3_hasher_finalize(&impl_->blake3, raw.data(), BLAKE3_OUT_LEN);
        raw_len = BLAKE3_OUT_LEN;
#endif
    } else {
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(impl_->md, raw.data(), &len) != 1) {
            impl_.reset();
            return digest_status(StatusCode::Crypto);
        }
        raw_len = static_cast<u32>(len);
    }

    out->algorithm = alg_;
    to_hex(raw.data(), raw_len, &out->encoded);
    impl_.reset();
    return ok_status();
}

} // namespace ocipush::digest
