#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "envfile/core/ordered_map.hpp"

namespace {

auto keys_of(const envfile::ValueMap& map) -> std::vector<std::string> {
    std::vector<std::string> keys;
    for (const auto& [key, value] : map) keys.push_back(key);
    return keys;
}

} // anonymous namespace

TEST_CASE("OrderedMap keeps insertion order", "[ordered_map]") {
    envfile::ValueMap map;
    CHECK(map.empty());

    CHECK(map.set("b", "1"));
    CHECK(map.set("a", "2"));
    CHECK(map.set("c", std::nullopt));

    CHECK(map.size() == 3);
    CHECK(keys_of(map) == std::vector<std::string>{"b", "a", "c"});
}

TEST_CASE("OrderedMap overwrite keeps the first position", "[ordered_map]") {
    envfile::ValueMap map;
    map.set("a", "1");
    map.set("b", "2");
    CHECK_FALSE(map.set("a", "3"));

    CHECK(map.size() == 2);
    CHECK(keys_of(map) == std::vector<std::string>{"a", "b"});
    REQUIRE(map.find("a") != nullptr);
    CHECK(*map.find("a") == "3");
}

TEST_CASE("OrderedMap lookup", "[ordered_map]") {
    envfile::ValueMap map;
    map.set("bare", std::nullopt);
    map.set("key", "value");

    SECTION("find returns a pointer to the stored value") {
        const auto* v = map.find("key");
        REQUIRE(v != nullptr);
        CHECK(*v == "value");
    }

    SECTION("bare names are present with no value") {
        REQUIRE(map.contains("bare"));
        const auto* v = map.find("bare");
        REQUIRE(v != nullptr);
        CHECK_FALSE(v->has_value());
    }

    SECTION("missing keys") {
        CHECK(map.find("missing") == nullptr);
        CHECK_FALSE(map.contains("missing"));
        CHECK_FALSE(map.get("missing").has_value());
    }
}

TEST_CASE("OrderedMap equality depends on order", "[ordered_map]") {
    envfile::ValueMap a;
    a.set("x", "1");
    a.set("y", "2");

    envfile::ValueMap b;
    b.set("x", "1");
    b.set("y", "2");

    envfile::ValueMap c;
    c.set("y", "2");
    c.set("x", "1");

    CHECK(a == b);
    CHECK_FALSE(a == c);
}
