#include "ocipush/core/errors.hpp"

namespace ocipush::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
        case StatusCode::Ok: return "ok";
        case StatusCode::Unknown: return "unknown";
        case StatusCode::Invalid: return "invalid";
        case StatusCode::NotFound: return "not-found";
        case StatusCode::AlreadyExists: return "already-exists";
        case StatusCode::Busy: return "busy";
        case StatusCode::Corrupt: return "corrupt";
        case StatusCode::Io: return "io";
        case StatusCode::Crypto: return "crypto";
        case StatusCode::Network: return "network";
        case StatusCode::Unsupported: return "unsupported";
        case StatusCode::Unavailable: return "unavailable";
        case StatusCode::Canceled: return "canceled";
        }
        return "unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
        case StatusDomain::Core: return "core";
        case StatusDomain::Stream: return "stream";
        case StatusDomain::Digest: return "digest";
        case StatusDomain::Registry: return "registry";
        case StatusDomain::Config: return "config";
        case StatusDomain::External: return "external";
        }
        return "unknown";
    }
} // namespace ocipush::core
