#include <catch2/catch.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <Debug.hpp>
#include <QueryString.hpp>

using qparam::query::QueryPair;
using namespace std::string_view_literals;

TEST_CASE("percent decoding", "[QueryString][decode]") {
    using qparam::query::decode;

    REQUIRE(decode("") == "");
    REQUIRE(decode("plain") == "plain");
    REQUIRE(decode("a%20b") == "a b");
    REQUIRE(decode("%7B%22k%22%3A1%7D") == R"({"k":1})");
    REQUIRE(decode("%c3%a4") == "\xC3\xA4"); // lower-case hex digits

    SECTION("malformed escapes pass through verbatim") {
        REQUIRE(decode("100%") == "100%");
        REQUIRE(decode("%2") == "%2");
        REQUIRE(decode("%zz") == "%zz");
        REQUIRE(decode("%%41") == "%A");
    }

    SECTION("'+' is only a space with form encoding") {
        REQUIRE(decode("a+b") == "a+b");
        REQUIRE(decode("a+b", true) == "a b");
        REQUIRE(decode("a%2Bb", true) == "a+b");
    }
}

TEST_CASE("percent encoding", "[QueryString][encode]") {
    using qparam::query::decode;
    using qparam::query::encode;

    REQUIRE(encode("") == "");
    REQUIRE(encode("AZaz09-_.~") == "AZaz09-_.~");
    REQUIRE(encode("a b") == "a%20b");
    REQUIRE(encode("a&b=c") == "a%26b%3Dc");
    REQUIRE(encode("100%") == "100%25");
    REQUIRE(encode("\xC3\xA4") == "%C3%A4");

    for (const auto &text : { "hello world"sv, R"({"nested":[1,2]})"sv, "a+b&c=d%e"sv, "\t\n"sv }) {
        REQUIRE_MESSAGE(decode(encode(text)) == text, fmt::format("round-trip of '{}'", text));
    }
}

TEST_CASE("tokenizer", "[QueryString][tokenize]") {
    using qparam::query::tokenize;

    REQUIRE(tokenize("").empty());
    REQUIRE(tokenize("&&&").empty());

    REQUIRE(tokenize("a=1") == std::vector<QueryPair>{ { "a", "1" } });
    REQUIRE(tokenize("a=1&b=2") == std::vector<QueryPair>{ { "a", "1" }, { "b", "2" } });
    REQUIRE(tokenize("a=1&&b=2") == std::vector<QueryPair>{ { "a", "1" }, { "b", "2" } });
    REQUIRE(tokenize("&a=1&") == std::vector<QueryPair>{ { "a", "1" } });

    SECTION("pair without '=' yields an empty value") {
        REQUIRE(tokenize("flag") == std::vector<QueryPair>{ { "flag", "" } });
        REQUIRE(tokenize("flag&a=") == std::vector<QueryPair>{ { "flag", "" }, { "a", "" } });
    }

    SECTION("split on the first '=' only") {
        REQUIRE(tokenize("expr=a=b") == std::vector<QueryPair>{ { "expr", "a=b" } });
        REQUIRE(tokenize("=value") == std::vector<QueryPair>{ { "", "value" } });
    }

    SECTION("keys and values are percent-decoded") {
        REQUIRE(tokenize("first%20name=John%20Doe") == std::vector<QueryPair>{ { "first name", "John Doe" } });
        REQUIRE(tokenize("k=a%26b") == std::vector<QueryPair>{ { "k", "a&b" } });
        REQUIRE(tokenize("k=a+b") == std::vector<QueryPair>{ { "k", "a+b" } });
        REQUIRE(tokenize("k=a+b", true) == std::vector<QueryPair>{ { "k", "a b" } });
    }

    SECTION("repeated keys keep their arrival order") {
        REQUIRE(tokenize("c=UK&c=US&d=1&c=FR") == std::vector<QueryPair>{ { "c", "UK" }, { "c", "US" }, { "d", "1" }, { "c", "FR" } });
    }

    REQUIRE(fmt::format("{}", QueryPair{ "k", "v" }) == "k='v'");
}

TEST_CASE("query extraction from URLs", "[QueryString][extractQuery]") {
    using qparam::query::extractQuery;

    static_assert(extractQuery("http://host/path?a=1#frag") == "a=1");
    REQUIRE(extractQuery("/users?level=25&gender=female") == "level=25&gender=female");
    REQUIRE(extractQuery("/users?") == "");
    REQUIRE(extractQuery("/users") == "");
    REQUIRE(extractQuery("/users#a?b") == "b");
    REQUIRE(extractQuery("?a=1?b=2") == "a=1?b=2");
}
