#pragma once

#include <type_traits>

#include "ocipush/core/errors.hpp"
#include "ocipush/core/types.hpp"

namespace ocipush::core {

    inline constexpr const char* kEnvQueueSize = "OCIPUSH_QUEUE_SIZE";
    inline constexpr const char* kEnvPipeBytes = "OCIPUSH_PIPE_BYTES";
    inline constexpr const char* kEnvVerifyContent = "OCIPUSH_VERIFY_CONTENT";
    inline constexpr const char* kEnvLogLevel = "OCIPUSH_LOG_LEVEL";

    // Layer upload tuning
    struct UploadConfig {
        u32 queue_capacity{5};          // Parts read ahead of the part currently uploading (0 behaves as 1)
        u64 pipe_capacity{1u << 20};    // Bytes buffered between write() and the chunk reader
        bool verify_content{true};      // Digest written bytes locally and check before completing
    };

    enum class LogLevel : u8 {
        Trace = 0,
        Debug,
        Info,
        Warn,
        Error,
        Off,
    };

    struct LogConfig {
        LogLevel level{LogLevel::Info};
        const char* pattern{nullptr};   // spdlog pattern, nullptr = library default
    };

    // Overrides fields from OCIPUSH_QUEUE_SIZE, OCIPUSH_PIPE_BYTES and
    // OCIPUSH_VERIFY_CONTENT. Unset variables leave the field alone. On any
    // malformed value nothing is applied.
    [[nodiscard]] Status upload_config_from_env(UploadConfig* cfg) noexcept;

    // Overrides level from OCIPUSH_LOG_LEVEL.
    [[nodiscard]] Status log_config_from_env(LogConfig* cfg) noexcept;

    // Accepts trace, debug, info, warn, error, off.
    [[nodiscard]] Status parse_log_level(const char* s, LogLevel* out) noexcept;

    static_assert(std::is_trivially_copyable_v<UploadConfig>);
    static_assert(std::is_trivially_copyable_v<LogConfig>);

} // namespace ocipush::core
