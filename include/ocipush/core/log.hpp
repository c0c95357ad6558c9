#pragma once

#include "ocipush/core/config.hpp"
#include "ocipush/core/errors.hpp"

namespace ocipush::core {
    // Configures the process-wide spdlog default logger. Library code logs
    // through spdlog's free functions and never logs an error it also returns
    // above debug level.
    [[nodiscard]] Status log_init(const LogConfig& cfg) noexcept;
} // namespace ocipush::core
