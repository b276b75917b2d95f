#ifndef LASERCUT_COMMON_LOGGING_HPP
#define LASERCUT_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace lasercut {
namespace logging {

// Environment variable holding the log level name
constexpr const char* LOG_LEVEL_ENV = "LASERCUT_LOG_LEVEL";

// trace, debug, info, warn, error or off
inline std::optional<spdlog::level::level_enum> level_from_name(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

// Process-wide logger writing to stderr. Level comes from LASERCUT_LOG_LEVEL,
// info when unset or unrecognised.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt("lasercut");
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
        log->set_level(spdlog::level::info);

        if (const char* level_env = std::getenv(LOG_LEVEL_ENV)) {
            if (auto level = level_from_name(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown {} value '{}'", LOG_LEVEL_ENV, level_env);
            }
        }
        return log;
    }();
    return logger;
}

// -v on the command line; an explicit LASERCUT_LOG_LEVEL wins
inline void set_verbose(bool verbose) {
    if (verbose && std::getenv(LOG_LEVEL_ENV) == nullptr) {
        get_logger()->set_level(spdlog::level::debug);
    }
}

}  // namespace logging
}  // namespace lasercut

#endif // LASERCUT_COMMON_LOGGING_HPP
