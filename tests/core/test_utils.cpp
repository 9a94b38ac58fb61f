#include <catch2/catch_test_macros.hpp>

#include "envfile/core/utils.hpp"

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(envfile::utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(envfile::utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("no whitespace") {
        REQUIRE(envfile::utils::trim("hello") == "hello");
    }

    SECTION("empty string") {
        REQUIRE(envfile::utils::trim("").empty());
    }

    SECTION("only whitespace") {
        REQUIRE(envfile::utils::trim("   \t\n  ").empty());
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(envfile::utils::trim("  hello world  ") == "hello world");
    }
}

TEST_CASE("to_lower", "[utils]") {
    CHECK(envfile::utils::to_lower("Hello World") == "hello world");
    CHECK(envfile::utils::to_lower("ALWAYS") == "always");
    CHECK(envfile::utils::to_lower("").empty());
}

TEST_CASE("is_alnum accepts only letters and digits", "[utils]") {
    CHECK(envfile::utils::is_alnum("abc123"));
    CHECK(envfile::utils::is_alnum("XYZ"));
    CHECK_FALSE(envfile::utils::is_alnum(""));
    CHECK_FALSE(envfile::utils::is_alnum("a b"));
    CHECK_FALSE(envfile::utils::is_alnum("a_b"));
    CHECK_FALSE(envfile::utils::is_alnum("a-b"));
}

TEST_CASE("shell_quote", "[utils]") {
    SECTION("safe strings are unchanged") {
        CHECK(envfile::utils::shell_quote("value") == "value");
        CHECK(envfile::utils::shell_quote("/usr/local/bin") == "/usr/local/bin");
        CHECK(envfile::utils::shell_quote("a=b,c:d") == "a=b,c:d");
    }

    SECTION("empty string") {
        CHECK(envfile::utils::shell_quote("") == "''");
    }

    SECTION("spaces and metacharacters are quoted") {
        CHECK(envfile::utils::shell_quote("hello world") == "'hello world'");
        CHECK(envfile::utils::shell_quote("$HOME") == "'$HOME'");
    }

    SECTION("single quotes are escaped") {
        CHECK(envfile::utils::shell_quote("it's") == "'it'\"'\"'s'");
    }
}

TEST_CASE("parse_bool", "[utils]") {
    CHECK(envfile::utils::parse_bool("1", false));
    CHECK(envfile::utils::parse_bool("TRUE", false));
    CHECK(envfile::utils::parse_bool(" yes ", false));
    CHECK(envfile::utils::parse_bool("on", false));
    CHECK_FALSE(envfile::utils::parse_bool("0", true));
    CHECK_FALSE(envfile::utils::parse_bool("False", true));
    CHECK_FALSE(envfile::utils::parse_bool("no", true));
    CHECK_FALSE(envfile::utils::parse_bool("off", true));

    SECTION("unrecognised text returns the fallback") {
        CHECK(envfile::utils::parse_bool("maybe", true));
        CHECK_FALSE(envfile::utils::parse_bool("maybe", false));
    }
}
