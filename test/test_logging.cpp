#include <doctest/doctest.h>

#include "parcelkit/logging.hpp"

using namespace parcelkit;

TEST_CASE("Logging - Level names") {
    CHECK(level_from_string("debug") == spdlog::level::debug);
    CHECK(level_from_string("WARN") == spdlog::level::warn);
    CHECK(level_from_string("warning") == spdlog::level::warn);
    CHECK(level_from_string("off") == spdlog::level::off);
    CHECK(level_from_string("verbose") == spdlog::level::info);
}

TEST_CASE("Logging - Shared logger") {
    auto a = logger();
    auto b = logger();
    CHECK(a == b);
    CHECK(a->name() == LOGGER_NAME);

    init_logging("error");
    CHECK(logger()->level() == spdlog::level::err);
    init_logging("info");
    CHECK(logger()->level() == spdlog::level::info);
}
