#ifndef QPARAM_QUERYSTRING_HPP
#define QPARAM_QUERYSTRING_HPP

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace qparam::query {

struct QueryPair {
    std::string key;
    std::string value;

    bool        operator==(const QueryPair &) const = default;
};

namespace detail {
constexpr inline bool isHexDigit(char c) noexcept { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }
constexpr inline int  hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}
// returns true only for RFC 3986 section 2.3 Unreserved Characters
constexpr inline bool isUnreserved(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
}
} // namespace detail

/**
 * RFC 3986 percent-decoding: '%XX' becomes the octet XX, everything else is copied.
 * Malformed escapes ('%' not followed by two hex digits) pass through as literal characters.
 * @param formEncoding if true, '+' decodes to ' ' (application/x-www-form-urlencoded semantics)
 */
inline std::string decode(std::string_view source, bool formEncoding = false) {
    std::string decoded;
    decoded.reserve(source.size());
    for (std::size_t i = 0; i < source.size(); ++i) {
        const char c = source[i];
        if (c == '%' && i + 2 < source.size() && detail::isHexDigit(source[i + 1]) && detail::isHexDigit(source[i + 2])) {
            decoded += static_cast<char>((detail::hexValue(source[i + 1]) << 4) | detail::hexValue(source[i + 2]));
            i += 2;
        } else if (c == '+' && formEncoding) {
            decoded += ' ';
        } else {
            decoded += c;
        }
    }
    return decoded;
}

inline std::string encode(std::string_view source) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex;

    for (auto c : source) {
        if (detail::isUnreserved(c)) {
            encoded << c;
        } else {
            // percent-encode RFC 3986 section 2.2 Reserved Characters i.e. [!#$%&'()*+,/:;=?@[]] and all non-ASCII octets
            encoded << std::uppercase;
            encoded << '%' << std::setw(2) << int(static_cast<uint8_t>(c));
            encoded << std::nouppercase;
        }
    }

    return encoded.str();
}

/**
 * splits a raw query string (the part after '?') on '&' and each pair on its first '='.
 * A pair without '=' yields an empty value, empty pairs are skipped. Never fails.
 */
inline std::vector<QueryPair> tokenize(std::string_view query, bool formEncoding = false) {
    std::vector<QueryPair> pairs;
    std::size_t            readPos = 0;
    while (readPos <= query.size()) {
        const auto pairEnd = std::min(query.find('&', readPos), query.size());
        const auto pair    = query.substr(readPos, pairEnd - readPos);
        readPos            = pairEnd + 1;
        if (pair.empty()) {
            continue;
        }
        const auto equal = pair.find('=');
        if (equal == std::string_view::npos) {
            pairs.push_back(QueryPair{ decode(pair, formEncoding), std::string{} });
        } else {
            pairs.push_back(QueryPair{ decode(pair.substr(0, equal), formEncoding), decode(pair.substr(equal + 1), formEncoding) });
        }
    }
    return pairs;
}

// the query part of a full URL or request target: everything between the first '?' and the following '#'
constexpr std::string_view extractQuery(std::string_view url) noexcept {
    const auto qMark = url.find('?');
    if (qMark == std::string_view::npos) {
        return {};
    }
    const auto query = url.substr(qMark + 1);
    return query.substr(0, query.find('#'));
}

} // namespace qparam::query

template<>
struct fmt::formatter<qparam::query::QueryPair> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin(); // not (yet) implemented
    }

    template<typename FormatContext>
    auto format(const qparam::query::QueryPair &v, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}='{}'", v.key, v.value);
    }
};

#endif // QPARAM_QUERYSTRING_HPP
