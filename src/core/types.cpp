#include "ocipush/core/types.hpp"

#include <chrono>

namespace ocipush::core {
    Timestamp now_millis() noexcept {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
    }
} // namespace ocipush::core
