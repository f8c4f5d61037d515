#include "parcelkit/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace parcelkit {

    namespace {
        std::mutex logger_mutex;
    }

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lock(logger_mutex);
        auto log = spdlog::get(LOGGER_NAME);
        if (!log) {
            log = spdlog::stdout_color_mt(LOGGER_NAME);
            log->set_level(spdlog::level::info);
        }
        return log;
    }

    spdlog::level::level_enum level_from_string(const std::string &level) {
        std::string lower = level;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "trace")
            return spdlog::level::trace;
        if (lower == "debug")
            return spdlog::level::debug;
        if (lower == "warn" || lower == "warning")
            return spdlog::level::warn;
        if (lower == "error")
            return spdlog::level::err;
        if (lower == "off")
            return spdlog::level::off;
        return spdlog::level::info;
    }

    void init_logging(const std::string &level) {
        auto log = logger();
        log->set_level(level_from_string(level));
        log->set_pattern("%Y-%m-%d %H:%M:%S.%e %^%l%$ %v");
    }

} // namespace parcelkit
