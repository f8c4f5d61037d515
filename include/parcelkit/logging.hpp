#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace parcelkit {

    inline constexpr const char *LOGGER_NAME = "parcelkit";

    // Shared "parcelkit" logger, created on first use as a colour stdout logger.
    std::shared_ptr<spdlog::logger> logger();

    // Sets the level of the parcelkit logger: trace|debug|info|warn|error|off. Unknown names map to info.
    void init_logging(const std::string &level);

    spdlog::level::level_enum level_from_string(const std::string &level);

} // namespace parcelkit
