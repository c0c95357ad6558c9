#include "ocipush/core/log.hpp"

#include <spdlog/spdlog.h>

namespace ocipush::core {
    namespace {
        constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [ocipush] %v";

        [[nodiscard]] spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Off: return spdlog::level::off;
            }
            return spdlog::level::info;
        }
    } // namespace

    Status log_init(const LogConfig& cfg) noexcept {
        try {
            spdlog::set_level(to_spdlog(cfg.level));
            spdlog::set_pattern(cfg.pattern != nullptr ? cfg.pattern : kDefaultPattern);
        } catch (const spdlog::spdlog_ex&) {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }
        return ok_status();
    }
} // namespace ocipush::core
