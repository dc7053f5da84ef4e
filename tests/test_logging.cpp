// tests/test_logging.cpp

#include <doctest/doctest.h>

#include "evidenceforge/log.hpp"

TEST_CASE("Log levels parse from their spdlog names")
{
    spdlog::level::level_enum lvl = spdlog::level::info;
    CHECK(ef::parse_log_level("debug", lvl));
    CHECK(lvl == spdlog::level::debug);
    CHECK(ef::parse_log_level("off", lvl));
    CHECK(lvl == spdlog::level::off);

    lvl = spdlog::level::info;
    CHECK_FALSE(ef::parse_log_level("chatty", lvl));
    CHECK(lvl == spdlog::level::info);
}

TEST_CASE("init_logging installs a reusable default logger")
{
    ef::init_logging(spdlog::level::warn);
    ef::init_logging(spdlog::level::warn);
    REQUIRE(spdlog::default_logger() != nullptr);
    CHECK(spdlog::default_logger()->name() == "evidenceforge");
    CHECK(spdlog::get_level() == spdlog::level::warn);
}
