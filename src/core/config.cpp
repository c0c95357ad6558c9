#include "ocipush/core/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace ocipush::core {
    namespace {
        [[nodiscard]] bool parse_u64(const char* s, u64* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            const char* end = s + std::strlen(s);
            if (end == s) {
                return false;
            }
            u64 v{};
            auto r = std::from_chars(s, end, v, 10);
            if (r.ec != std::errc() || r.ptr != end) {
                return false;
            }
            *out = v;
            return true;
        }

        [[nodiscard]] bool parse_bool(const char* s, bool* out) noexcept {
            if (out == nullptr || s == nullptr) {
                return false;
            }
            if (std::strcmp(s, "1") == 0 || std::strcmp(s, "true") == 0 || std::strcmp(s, "yes") == 0) {
                *out = true;
                return true;
            }
            if (std::strcmp(s, "0") == 0 || std::strcmp(s, "false") == 0 || std::strcmp(s, "no") == 0) {
                *out = false;
                return true;
            }
            return false;
        }

        [[nodiscard]] Status config_invalid() noexcept {
            return make_status(StatusDomain::Config, StatusCode::Invalid);
        }
    } // namespace

    Status upload_config_from_env(UploadConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return config_invalid();
        }

        UploadConfig next = *cfg;

        if (const char* v = std::getenv(kEnvQueueSize); v != nullptr) {
            u64 n = 0;
            if (!parse_u64(v, &n) || n > 0xffffffffull) {
                return config_invalid();
            }
            next.queue_capacity = static_cast<u32>(n);
        }

        if (const char* v = std::getenv(kEnvPipeBytes); v != nullptr) {
            u64 n = 0;
            if (!parse_u64(v, &n) || n == 0) {
                return config_invalid();
            }
            next.pipe_capacity = n;
        }

        if (const char* v = std::getenv(kEnvVerifyContent); v != nullptr) {
            bool b = false;
            if (!parse_bool(v, &b)) {
                return config_invalid();
            }
            next.verify_content = b;
        }

        *cfg = next;
        return ok_status();
    }

    Status parse_log_level(const char* s, LogLevel* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return config_invalid();
        }

        struct Entry {
            const char* name;
            LogLevel level;
        };
        static constexpr Entry kLevels[] = {
            {"trace", LogLevel::Trace},
            {"debug", LogLevel::Debug},
            {"info", LogLevel::Info},
            {"warn", LogLevel::Warn},
            {"error", LogLevel::Error},
            {"off", LogLevel::Off},
        };

        for (const Entry& e : kLevels) {
            if (std::strcmp(e.name, s) == 0) {
                *out = e.level;
                return ok_status();
            }
        }
        return config_invalid();
    }

    Status log_config_from_env(LogConfig* cfg) noexcept {
        if (cfg == nullptr) {
            return config_invalid();
        }
        const char* v = std::getenv(kEnvLogLevel);
        if (v == nullptr) {
            return ok_status();
        }
        return parse_log_level(v, &cfg->level);
    }
} // namespace ocipush::core
