#ifndef QPARAM_DOCUMENTBRIDGE_HPP
#define QPARAM_DOCUMENTBRIDGE_HPP

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include <QueryString.hpp>

#include <Document.hpp>

namespace qparam {

/**
 * syntactic check only: true if the first non-whitespace character of 'raw' opens an object ('{') or an array ('[')
 */
constexpr bool looksLikeDocument(std::string_view raw) noexcept {
    const auto first = raw.find_first_not_of(" \t\r\n");
    return first != std::string_view::npos && (raw[first] == '{' || raw[first] == '[');
}

/**
 * parses a raw query value that carries a structured document literal, percent-decoding it once more
 * (without form semantics) before handing it to the document parser
 */
inline std::expected<document::Value, std::string> parseDocumentParameter(std::string_view raw, std::size_t maxDepth) {
    return document::parse(query::decode(raw), maxDepth);
}

} // namespace qparam

#endif // QPARAM_DOCUMENTBRIDGE_HPP
