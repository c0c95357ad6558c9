#include "ocipush/stream/byte_source.hpp"

#include <algorithm>
#include <cstring>

namespace ocipush::stream {
    ocipush::core::Status MemorySource::read(u8* dst, u64 cap, u64* n) noexcept {
        if (n == nullptr || (cap > 0 && dst == nullptr) || !ocipush::core::buffer_ok(data_)) {
            return ocipush::core::make_status(ocipush::core::StatusDomain::Stream, ocipush::core::StatusCode::Invalid);
        }

        const u64 take = std::min(cap, data_.len - pos_);
        if (take > 0) {
            std::memcpy(dst, data_.data + pos_, static_cast<size_t>(take));
            pos_ += take;
        }
        *n = take;
        return ocipush::core::ok_status();
    }
} // namespace ocipush::stream
