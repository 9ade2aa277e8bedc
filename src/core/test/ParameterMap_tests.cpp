#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include <fmt/format.h>

#include <Debug.hpp>
#include <ParameterMap.hpp>

using qparam::ParameterMap;

TEST_CASE("parameter map construction", "[ParameterMap]") {
    qparam::debug::Timer timer("ParameterMap - construction", 40);

    REQUIRE(ParameterMap{}.empty());
    REQUIRE(ParameterMap::parse("").empty());
    REQUIRE(ParameterMap::parse("&&").size() == 0);

    const auto map = ParameterMap::parse("level=25&gender=female&roles=developer,tester,manager");
    REQUIRE(map.size() == 3);
    REQUIRE(map.keys() == std::vector<std::string>{ "level", "gender", "roles" });
    REQUIRE(map.contains("level"));
    REQUIRE_FALSE(map.contains("LEVEL"));
    REQUIRE_FALSE(map.contains("age"));

    const auto *roles = map.find("roles");
    REQUIRE(roles != nullptr);
    REQUIRE(roles->key == "roles");
    REQUIRE(roles->values == std::vector<std::string>{ "developer,tester,manager" }); // splitting is up to the decoder
    REQUIRE(map.find("age") == nullptr);
}

TEST_CASE("duplicate keys are preserved", "[ParameterMap][duplicates]") {
    const auto map = ParameterMap::parse("country=UK&level=1&country=US&country=FR");
    REQUIRE(map.size() == 2);
    REQUIRE(map.keys() == std::vector<std::string>{ "country", "level" }); // first-seen order

    const auto *country = map.find("country");
    REQUIRE(country != nullptr);
    REQUIRE(country->values == std::vector<std::string>{ "UK", "US", "FR" }); // arrival order

    SECTION("iteration follows first-seen key order") {
        std::vector<std::string> keys;
        std::size_t              valueCount = 0;
        for (const auto &entry : map) {
            keys.push_back(entry.key);
            valueCount += entry.values.size();
            REQUIRE_FALSE(entry.values.empty());
        }
        REQUIRE(keys == std::vector<std::string>{ "country", "level" });
        REQUIRE(valueCount == 4);
    }
}

TEST_CASE("parameter map is a read-only view", "[ParameterMap][immutability]") {
    const auto map  = ParameterMap::parse("a=1&b=2&a=3");
    const auto copy = map;
    REQUIRE(copy == map);

    // only const accessors exist, repeated reads yield the same data
    REQUIRE(map.find("a")->values == std::vector<std::string>{ "1", "3" });
    REQUIRE(map.find("a")->values == std::vector<std::string>{ "1", "3" });
    REQUIRE(map == ParameterMap::parse("a=1&b=2&a=3"));
    REQUIRE_FALSE(map == ParameterMap::parse("a=3&b=2&a=1"));
}

TEST_CASE("parameter map of encoded queries", "[ParameterMap][encoding]") {
    const auto map = ParameterMap::parse("na%6De=J+D&flag&empty=");
    REQUIRE(map.find("name")->values == std::vector<std::string>{ "J+D" });
    REQUIRE(map.find("flag")->values == std::vector<std::string>{ "" });
    REQUIRE(map.find("empty")->values == std::vector<std::string>{ "" });

    const auto form = ParameterMap::parse("name=J+D", true);
    REQUIRE(form.find("name")->values == std::vector<std::string>{ "J D" });

    REQUIRE(fmt::format("{}", ParameterMap::parse("a=1&b=x&a=2")) == R"({a: ["1", "2"], b: ["x"]})");
}
