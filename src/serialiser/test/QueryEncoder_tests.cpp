#pragma clang diagnostic push
#pragma ide diagnostic ignored "cppcoreguidelines-avoid-magic-numbers"

#include <catch2/catch.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <units/isq/si/length.h>

#include <Debug.hpp>
#include <QueryString.hpp>
#include <qparam.hpp>

#include <QueryDecoder.hpp>
#include <QueryEncoder.hpp>

using namespace units::isq;
using namespace units::isq::si;
using qparam::Annotated;
using qparam::DecodeConfig;
using qparam::query::QueryPair;

struct Coordinates {
    double  latitude;
    double  longitude;
    int32_t zoom;

    bool    operator==(const Coordinates &) const = default;
};
QPARAM_REFLECT(Coordinates, latitude, longitude, zoom)

struct ReportQuery {
    std::string                                      title;
    int32_t                                          level;
    bool                                             verbose;
    std::vector<std::string>                         roles;
    std::vector<double>                              ratings;
    std::optional<int64_t>                           limit;
    std::chrono::sys_seconds                         created;
    Coordinates                                      location;
    std::vector<Coordinates>                         waypoints;
    std::array<uint8_t, 3>                           colour;
    Annotated<float, length<metre>, "search radius"> radius;

    bool                                             operator==(const ReportQuery &) const = default;
};
QPARAM_REFLECT(ReportQuery, title, level, verbose, roles, ratings, limit, created, location, waypoints, colour, radius)

struct Sampling {
    std::chrono::sys_time<std::chrono::milliseconds> taken;
    std::vector<float>                               values;

    bool                                             operator==(const Sampling &) const = default;
};
QPARAM_REFLECT(Sampling, taken, values)

namespace {
ReportQuery sampleQuery() {
    return ReportQuery{
        .title     = "Q3 & Q4: 100% done?",
        .level     = -7,
        .verbose   = true,
        .roles     = { "developer", "tester" },
        .ratings   = { 0.1, 2.5e-8, 1.0 / 3.0 },
        .limit     = 1000,
        .created   = std::chrono::sys_seconds{ std::chrono::sys_days{ std::chrono::year{ 2021 } / 6 / 30 } } + std::chrono::hours{ 13 },
        .location  = { 46.2, 6.14, 12 },
        .waypoints = { { 1.5, -2.5, 3 }, { 0.0, 0.0, 0 } },
        .colour    = { 255, 128, 0 },
        .radius    = 2.5F
    };
}
} // namespace

TEST_CASE("serialised field pairs", "[QueryEncoder][serialise]") {
    const auto pairs = qparam::serialise(Coordinates{ 46.5, -6.25, 3 });
    REQUIRE(pairs == std::vector<QueryPair>{ { "latitude", "46.5" }, { "longitude", "-6.25" }, { "zoom", "3" } });
    REQUIRE(qparam::encode(Coordinates{ 46.5, -6.25, 3 }) == "latitude=46.5&longitude=-6.25&zoom=3");

    SECTION("scalar arrays are joined, nested values are document literals") {
        auto query      = sampleQuery();
        query.limit     = std::nullopt;
        const auto raw  = qparam::serialise(query);
        const auto find = [&raw](std::string_view key) -> std::string {
            for (const auto &[k, v] : raw) {
                if (k == key) {
                    return v;
                }
            }
            return "<absent>";
        };
        REQUIRE(find("roles") == "developer,tester");
        REQUIRE(find("verbose") == "true");
        REQUIRE(find("limit") == "<absent>");
        REQUIRE(find("created") == "2021-06-30T13:00:00Z");
        REQUIRE(find("location") == R"({"latitude":46.2,"longitude":6.14,"zoom":12})");
        REQUIRE(find("waypoints") == R"([{"latitude":1.5,"longitude":-2.5,"zoom":3},{"latitude":0,"longitude":0,"zoom":0}])");
        REQUIRE(find("colour") == "255,128,0");
        REQUIRE(find("radius") == "2.5");
    }

    SECTION("elements containing the delimiter become repeated keys") {
        const auto pairs2 = qparam::serialise(ReportQuery{ .roles = { "a,b", "c" } });
        REQUIRE(std::ranges::count(pairs2, QueryPair{ "roles", "a,b" }) == 1);
        REQUIRE(std::ranges::count(pairs2, QueryPair{ "roles", "c" }) == 1);
    }
}

TEST_CASE("encoded queries decode to the original value", "[QueryEncoder][roundtrip]") {
    qparam::debug::Timer timer("QueryEncoder - round-trip", 40);

    const auto original = sampleQuery();
    const auto encoded  = qparam::encode(original);
    REQUIRE(encoded.find(' ') == std::string::npos);
    REQUIRE(encoded.find("title=Q3%20%26%20Q4%3A%20100%25%20done%3F") != std::string::npos);

    const auto decoded = qparam::decode<ReportQuery>(encoded);
    REQUIRE_MESSAGE(decoded.has_value(), fmt::format("encoded: {}", encoded));
    REQUIRE(*decoded == original);

    SECTION("absent optional") {
        auto query  = sampleQuery();
        query.limit = std::nullopt;
        REQUIRE(qparam::decode<ReportQuery>(qparam::encode(query)) == query);
    }

    SECTION("delicate strings") {
        auto query = sampleQuery();
        for (const auto *title : { "", "[not a document]", "{\"a\":1}", "a,b", "100%25", "x=y&z", " leading and trailing ", "\xC3\xA4+\xE2\x82\xAC" }) {
            query.title = title;
            REQUIRE_MESSAGE(qparam::decode<ReportQuery>(qparam::encode(query)) == query, fmt::format("title: '{}'", title));
        }
    }

    SECTION("delicate arrays") {
        auto query = sampleQuery();
        for (const auto &roles : std::vector<std::vector<std::string>>{ { "single" }, { "a,b", "c" }, { "[x]" }, { "{y}", "z" }, { "" }, { "", "" }, { "50%", "a&b" } }) {
            query.roles = roles;
            REQUIRE_MESSAGE(qparam::decode<ReportQuery>(qparam::encode(query)) == query, fmt::format("roles: [{}]", fmt::join(roles, "|")));
        }
    }

    SECTION("custom configuration") {
        DecodeConfig config;
        config.arrayDelimiter = ';';
        config.dateFormat     = qparam::DateFormat("dd.MM.yyyy HH:mm:ss");
        config.timeZone       = qparam::TimeZone::fixed(std::chrono::minutes{ -300 });
        auto query            = sampleQuery();
        query.roles           = { "a,b", "c" };

        const auto encodedWithConfig = qparam::encode(query, config);
        REQUIRE(encodedWithConfig.find("created=30.06.2021%2008%3A00%3A00") != std::string::npos);
        REQUIRE(encodedWithConfig.find("roles=a%2Cb%3Bc") != std::string::npos);
        REQUIRE(qparam::decode<ReportQuery>(encodedWithConfig, config) == query);
    }
}

TEST_CASE("sub-second time points", "[QueryEncoder][date]") {
    using namespace std::chrono_literals;
    const Sampling sampling{ std::chrono::sys_days{ std::chrono::year{ 2020 } / 1 / 1 } + 250ms, { 0.5F, -1.25F } };

    REQUIRE_THROWS_AS(qparam::encode(sampling), std::invalid_argument);

    DecodeConfig config;
    config.dateFormat    = qparam::DateFormat("yyyy-MM-dd'T'HH:mm:ss.SSSXXX");
    const auto encoded   = qparam::encode(sampling, config);
    REQUIRE(encoded.find("taken=2020-01-01T00%3A00%3A00.250Z") != std::string::npos);
    REQUIRE(qparam::decode<Sampling>(encoded, config) == sampling);

    const Sampling wholeSeconds{ std::chrono::sys_days{ std::chrono::year{ 2020 } / 1 / 1 } + 2s, {} };
    REQUIRE(qparam::decode<Sampling>(qparam::encode(wholeSeconds)) == wholeSeconds);
}

#pragma clang diagnostic pop
