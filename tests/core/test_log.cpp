// habitat_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <habitat/core/log.hpp>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <string>

using namespace habitat_core;

namespace {

std::ostringstream g_captured;

} // namespace

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());

    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::info)) == "info");
}

TEST_CASE("Named loggers", "[core][log]") {
    auto a = get_logger("habitat_test");
    auto b = get_logger("habitat_test");
    REQUIRE(a == b);
    REQUIRE(a->name() == "habitat_test");

    REQUIRE(ecs_logger()->name() == "habitat_ecs");
    REQUIRE(grid_logger()->name() == "habitat_grid");
    REQUIRE(core_logger()->name() == "habitat_core");
}

TEST_CASE("Log level management", "[core][log]") {
    auto logger = get_logger("habitat_level_test");
    auto previous = logger->level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(logger->level() == spdlog::level::err);
    REQUIRE(ecs_logger()->level() == spdlog::level::err);
    REQUIRE(get_logger("habitat_level_late")->level() == spdlog::level::err);

    set_global_log_level(previous);
    REQUIRE(logger->level() == previous);
}

TEST_CASE("log_structured formats key/value fields", "[core][log]") {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(g_captured);
    sink->set_pattern("%v");
    auto logger = get_logger("habitat_structured_test");
    logger->sinks().push_back(sink);
    logger->set_level(spdlog::level::info);

    SECTION("fields in key order") {
        log_structured(spdlog::level::info, "habitat_structured_test", "entity created",
                       {{"type", "animal"}, {"id", "lion_1"}});
        REQUIRE(g_captured.str() == "entity created {id=\"lion_1\", type=\"animal\"}\n");
    }

    SECTION("no fields, no braces") {
        log_structured(spdlog::level::warn, "habitat_structured_test", "index rebuilt", {});
        REQUIRE(g_captured.str() == "index rebuilt\n");
    }

    SECTION("below the threshold nothing is written") {
        log_structured(spdlog::level::debug, "habitat_structured_test", "skipped", {{"k", "v"}});
        REQUIRE(g_captured.str().empty());
    }

    logger->sinks().pop_back();
    g_captured.str("");
}

TEST_CASE("configure_logging keeps loggers usable", "[core][log]") {
    LogConfig config;
    config.console_enabled = false;
    config.level = spdlog::level::warn;
    configure_logging(config);

    auto logger = get_logger("habitat_config_test");
    REQUIRE(logger->level() == spdlog::level::warn);
    REQUIRE(logger->sinks().empty());
    logger->warn("dropped: no sinks");

    configure_logging(LogConfig{});
    REQUIRE(get_logger("habitat_config_test")->sinks().size() == 1);
}
