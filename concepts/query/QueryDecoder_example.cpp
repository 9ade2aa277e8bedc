#include <chrono>
#include <iostream>
#include <optional>
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

struct Location {
    double latitude;
    double longitude;
};
QPARAM_REFLECT(Location, latitude, longitude)

struct UserSearch {
    int32_t                                                 level;
    std::string                                             gender;
    std::vector<std::string>                                roles;
    std::vector<std::string>                                country;
    std::optional<std::chrono::sys_seconds>                 since;
    std::optional<Location>                                 near;
    qparam::Annotated<double, length<kilometre>, "radius"> radius = 10.0;
};
QPARAM_REFLECT(UserSearch, level, gender, roles, country, since, near, radius)

/**
 * simple example to illustrate decoding of query parameters into a typed request
 */
int main() {
    const auto target = std::string_view{ R"(/users?level=25&gender=female&roles=developer,tester&country=UK&country=US&since=2020-01-01T00:00:00Z&near={"latitude":46.2,"longitude":6.14}&radius=2.5)" };

    {
        qparam::debug::Timer timer("decode UserSearch", 30);
        const auto           search = qparam::decode<UserSearch>(qparam::query::extractQuery(target));
        if (!search) {
            fmt::print("unexpected failure: {}\n", search.error());
            return 1;
        }
        fmt::print("level: {} gender: '{}' roles: {} country: {}\n", search->level, search->gender, search->roles, search->country);
        fmt::print("since: {} near: ({}, {}) radius: {} {}\n", search->since ? search->since->time_since_epoch().count() : 0, //
                search->near ? search->near->latitude : 0.0, search->near ? search->near->longitude : 0.0, search->radius.value(), search->radius.getUnit());
        fmt::print("re-encoded: {}\n", qparam::encode(*search));
    }

    // all failures are collected in one report
    qparam::DecodeConfig config;
    config.logErrors  = true;
    const auto failed = qparam::decode<UserSearch>("level=high&roles=developer&radius=far&since=yesterday&near={\"latitude\":1", config);
    if (!failed) {
        for (const auto &error : failed.error()) {
            fmt::print("{:<18} at '{}'\n", error.kind, error.path);
        }
    }

    try {
        [[maybe_unused]] const auto search = qparam::decodeOrThrow<UserSearch>("gender=x");
    } catch (const qparam::DecodeException &e) {
        std::cout << "std::ostream report output: " << e.report() << '\n';
    }

    return 0;
}
