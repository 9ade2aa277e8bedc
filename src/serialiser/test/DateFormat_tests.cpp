#include <catch2/catch.hpp>

#include <chrono>
#include <stdexcept>
#include <string>

#include <DateFormat.hpp>
#include <DecodeConfig.hpp>

using namespace std::chrono_literals;
using qparam::DateFormat;
using qparam::TimeZone;
using Millis = std::chrono::sys_time<std::chrono::milliseconds>;

namespace {
constexpr Millis at(int year, unsigned month, unsigned day, std::chrono::milliseconds timeOfDay = 0ms) {
    return Millis{ std::chrono::sys_days{ std::chrono::year{ year } / std::chrono::month{ month } / std::chrono::day{ day } } } + timeOfDay;
}
} // namespace

TEST_CASE("time zone ids", "[DateFormat][TimeZone]") {
    REQUIRE(TimeZone::utc().offset() == 0min);
    REQUIRE(TimeZone{}.offset() == 0min);
    for (const auto *id : { "UTC", "GMT", "Z", "Etc/UTC" }) {
        REQUIRE(TimeZone::parse(id) == TimeZone::utc());
    }
    REQUIRE(TimeZone::parse("UTC+01:00")->offset() == 60min);
    REQUIRE(TimeZone::parse("GMT-05")->offset() == -300min);
    REQUIRE(TimeZone::parse("+0130")->offset() == 90min);
    REQUIRE(TimeZone::parse("-03:30")->offset() == -210min);
    REQUIRE(TimeZone("UTC+02:00") == TimeZone::fixed(120min));

    REQUIRE_FALSE(TimeZone::parse("Europe/Berlin"));
    REQUIRE_FALSE(TimeZone::parse("UTC+1"));
    REQUIRE_FALSE(TimeZone::parse("+25:00"));
    REQUIRE_FALSE(TimeZone::parse("+01:60"));
    REQUIRE_FALSE(TimeZone::parse(""));
    REQUIRE_THROWS_AS(TimeZone("CET"), std::invalid_argument);
    REQUIRE_THROWS_AS(TimeZone::fixed(19h), std::invalid_argument);

    REQUIRE(TimeZone::utc().name() == "UTC");
    REQUIRE(TimeZone::fixed(-90min).name() == "UTC-01:30");
}

TEST_CASE("date pattern compilation", "[DateFormat][pattern]") {
    REQUIRE(DateFormat{}.pattern() == DateFormat::DEFAULT_PATTERN);
    REQUIRE_NOTHROW(DateFormat("yyyy-MM-dd"));
    REQUIRE_NOTHROW(DateFormat("d/M/y H:m:s"));
    REQUIRE_NOTHROW(DateFormat("'day' dd 'of' MM''yyyy"));

    REQUIRE_THROWS_AS(DateFormat("yyyy-MM-dd hh:mm"), std::invalid_argument); // 'h' (12-hour clock) is not supported
    REQUIRE_THROWS_AS(DateFormat("yy-MM-dd"), std::invalid_argument);
    REQUIRE_THROWS_AS(DateFormat("yyyy-MMM-dd"), std::invalid_argument);
    REQUIRE_THROWS_AS(DateFormat("ss.SS"), std::invalid_argument);
    REQUIRE_THROWS_AS(DateFormat("yyyy'T"), std::invalid_argument);

    SECTION("config construction validates eagerly") {
        qparam::DecodeConfig config;
        REQUIRE_THROWS_AS(config.dateFormat = DateFormat("EEE, dd MMM yyyy"), std::invalid_argument);
        REQUIRE(config.dateFormat.pattern() == DateFormat::DEFAULT_PATTERN);
    }
}

TEST_CASE("date parsing", "[DateFormat][parse]") {
    const DateFormat isoFormat;
    REQUIRE(isoFormat.parse("2020-01-01T00:00:00Z") == at(2020, 1, 1));
    REQUIRE(isoFormat.parse("2020-02-29T12:34:56Z") == at(2020, 2, 29, 12h + 34min + 56s));
    REQUIRE(isoFormat.parse("2020-01-01T00:00:00+00") == at(2020, 1, 1));
    REQUIRE(isoFormat.parse("2020-01-01T00:00:00+0000") == at(2020, 1, 1));
    REQUIRE(isoFormat.parse("2020-01-01T05:30:00+05:30") == at(2020, 1, 1));
    REQUIRE(isoFormat.parse("2020-01-01T00:00:00Z", TimeZone::fixed(60min)) == at(2020, 1, 1)); // explicit zone wins

    REQUIRE_FALSE(isoFormat.parse(""));
    REQUIRE_FALSE(isoFormat.parse("2019-02-29T00:00:00Z"));
    REQUIRE_FALSE(isoFormat.parse("2020-13-01T00:00:00Z"));
    REQUIRE_FALSE(isoFormat.parse("2020-1-01T00:00:00Z"));
    REQUIRE_FALSE(isoFormat.parse("2020-01-01 00:00:00Z"));
    REQUIRE_FALSE(isoFormat.parse("2020-01-01T00:60:00Z"));
    REQUIRE_FALSE(isoFormat.parse("2020-01-01T00:00:00+5"));

    SECTION("variable-width fields") {
        const DateFormat format("d/M/y");
        REQUIRE(format.parse("1/2/2020") == at(2020, 2, 1));
        REQUIRE(format.parse("01/12/2020") == at(2020, 12, 1));
        REQUIRE_FALSE(format.parse("001/12/2020"));
    }

    SECTION("configured zone applies without zone field") {
        const DateFormat format("yyyy-MM-dd HH:mm");
        REQUIRE(format.parse("2020-01-01 00:00") == at(2020, 1, 1));
        REQUIRE(format.parse("2020-01-01 01:00", TimeZone::fixed(60min)) == at(2020, 1, 1));
        REQUIRE(format.parse("2020-01-01 00:00", TimeZone::fixed(-60min)) == at(2020, 1, 1, 1h));
    }

    SECTION("quoted literals") {
        const DateFormat format("'day' dd 'of' MM''yyyy");
        REQUIRE(format.parse("day 05 of 03'2021") == at(2021, 3, 5));
        REQUIRE_FALSE(format.parse("day 05 of 03 2021"));
    }

    SECTION("coarser target durations truncate") {
        const DateFormat format("yyyy-MM-dd'T'HH:mm:ss.SSSX");
        REQUIRE(format.parse("2020-01-01T00:00:01.999Z") == at(2020, 1, 1, 1999ms));
        REQUIRE(format.parse<std::chrono::seconds>("2020-01-01T00:00:01.999Z") == std::chrono::floor<std::chrono::seconds>(at(2020, 1, 1)) + 1s);
    }
}

TEST_CASE("date formatting", "[DateFormat][format]") {
    const DateFormat isoFormat;
    REQUIRE(isoFormat.format(at(2020, 1, 1)) == "2020-01-01T00:00:00Z");
    REQUIRE(isoFormat.format(at(2020, 1, 1), TimeZone::fixed(90min)) == "2020-01-01T01:30:00+0130");
    REQUIRE(isoFormat.format(at(2020, 1, 1), TimeZone::fixed(-300min)) == "2019-12-31T19:00:00-0500");

    REQUIRE(DateFormat("d/M/y").format(at(2020, 2, 1)) == "1/2/2020");
    REQUIRE(DateFormat("dd.MM.yyyy HH:mm:ss.SSS").format(at(2020, 2, 1, 7ms)) == "01.02.2020 00:00:00.007");
    REQUIRE(DateFormat("yyyy-MM-dd'T'HH:mmXXX").format(at(2020, 2, 1), TimeZone::fixed(-30min)) == "2020-01-31T23:30-00:30");

    for (const auto *pattern : { "yyyy-MM-dd'T'HH:mm:ss.SSSXXX", "dd.MM.yyyy HH:mm:ss.SSS Z", "'at' yyyy/MM/dd HH:mm:ss.SSSX" }) {
        const DateFormat format(pattern);
        for (const auto zone : { TimeZone::utc(), TimeZone::fixed(330min), TimeZone::fixed(-600min) }) {
            const auto timeStamp = at(1999, 12, 31, 23h + 59min + 59s + 999ms);
            REQUIRE(format.parse(format.format(timeStamp, zone), zone) == timeStamp);
        }
    }
}
