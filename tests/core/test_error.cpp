// habitat_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <habitat/core/error.hpp>
#include <string>

using namespace habitat_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("EntityError::duplicate_id") {
        Error err = EntityError::duplicate_id("lion_1");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.is<EntityError>());
        REQUIRE(err.as<EntityError>()->kind == EntityError::Kind::DuplicateId);
        REQUIRE(err.as<EntityError>()->entity_id == "lion_1");
        REQUIRE(err.message().find("lion_1") != std::string::npos);
    }

    SECTION("EntityError::not_found") {
        Error err = EntityError::not_found("ghost");
        REQUIRE(err.code() == ErrorCode::NotFound);
    }

    SECTION("EntityError::inactive") {
        Error err = EntityError::inactive("e1", "position");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message().find("inactive entity") != std::string::npos);
    }

    SECTION("GridError kinds") {
        REQUIRE(Error(GridError::invalid_dimensions(0, 5)).code() == ErrorCode::InvalidArgument);
        REQUIRE(Error(GridError::dimension_mismatch("rows")).code() == ErrorCode::ValidationError);
        REQUIRE(Error(GridError::invalid_tile(1, 2, "bad")).code() == ErrorCode::ParseError);

        Error oob = GridError::out_of_bounds(-1, 3);
        REQUIRE(oob.code() == ErrorCode::OutOfBounds);
        REQUIRE(oob.as<GridError>()->x == -1);
        REQUIRE(oob.as<GridError>()->y == 3);
    }

    SECTION("ConfigError kinds") {
        REQUIRE(Error(ConfigError::file_not_found("a.json")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ConfigError::parse_failed("eof")).code() == ErrorCode::ParseError);

        Error err = ConfigError::invalid_value("world.width", "negative");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "world.width");
        REQUIRE_FALSE(err.is<GridError>());
        REQUIRE(err.as<GridError>() == nullptr);
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = EntityError::duplicate_id("zebra");
    err.with_context("source", "save.json");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[AlreadyExists]") != std::string::npos);
    REQUIRE(chain.find("[EntityError]") != std::string::npos);
    REQUIRE(chain.find("zebra") != std::string::npos);
    REQUIRE(chain.find("[source=save.json]") != std::string::npos);
}

TEST_CASE("InactiveEntityError", "[core][error]") {
    InactiveEntityError ex(EntityError::inactive("e7", "animal"));

    REQUIRE(ex.entity_id() == "e7");
    REQUIRE(ex.error().component_type == "animal");
    REQUIRE(std::string(ex.what()).find("inactive entity") != std::string::npos);

    const std::logic_error& base = ex;
    REQUIRE(std::string(base.what()) == ex.error().message);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
        REQUIRE(*r == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE(static_cast<bool>(r));
    }

    SECTION("Err with domain error") {
        Result<int> r = Err<int>(Error(EntityError::not_found("x")));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("Err with message") {
        Result<void> r = Err(std::string("went wrong"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "went wrong");
    }
}

TEST_CASE("Result unwrap", "[core][result]") {
    SECTION("ok value") {
        Result<std::string> r = Ok(std::string("zoo"));
        REQUIRE(r.unwrap() == "zoo");
    }

    SECTION("error throws") {
        Result<std::string> r = Err<std::string>(Error(ErrorCode::IOError, "disk"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);

        Result<void> v = Err(Error(ErrorCode::IOError, "disk"));
        REQUIRE_THROWS_AS(v.unwrap(), std::runtime_error);
    }
}

TEST_CASE("Result map", "[core][result]") {
    Result<int> r = Ok(21);
    auto doubled = r.map([](int v) { return v * 2; });
    REQUIRE(doubled.is_ok());
    REQUIRE(doubled.value() == 42);

    Result<int> failed = Err<int>(Error(ErrorCode::InvalidArgument, "bad"));
    auto mapped = failed.map([](int v) { return v * 2; });
    REQUIRE(mapped.is_err());
    REQUIRE(mapped.error().code() == ErrorCode::InvalidArgument);
}
