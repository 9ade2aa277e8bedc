#ifndef QPARAM_DOCUMENT_HPP
#define QPARAM_DOCUMENT_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace qparam {

class ProtocolException : public std::exception {
    const std::string errorMsg;

public:
    explicit ProtocolException(std::string errorMessage) noexcept
        : errorMsg(std::move(errorMessage)) {}
    explicit ProtocolException(const char *errorMessage) noexcept
        : errorMsg(errorMessage) {}
    template<typename... ErrorArgs>
    explicit ProtocolException(fmt::format_string<ErrorArgs...> fmt, ErrorArgs &&...errorArgs) noexcept
        : errorMsg(fmt::format(fmt, std::forward<ErrorArgs>(errorArgs)...)) {}

    [[nodiscard]] const char *what() const noexcept override { return errorMsg.data(); }
};

inline std::ostream &operator<<(std::ostream &os, const ProtocolException &exception) {
    return os << "ProtocolException(\"" << exception.what() << "\")";
}

/**
 * Generic tree of a structured (JSON) document value, used for query values that are themselves
 * object or array literals, e.g. 'nested={"nestedInt":1234,"nestedString":"s"}'.
 */
namespace document {

enum class Kind { NUL,
    BOOL,
    NUMBER,
    STRING,
    ARRAY,
    OBJECT };

constexpr std::string_view kindName(Kind kind) noexcept {
    switch (kind) {
    case Kind::NUL: return "null";
    case Kind::BOOL: return "bool";
    case Kind::NUMBER: return "number";
    case Kind::STRING: return "string";
    case Kind::ARRAY: return "array";
    case Kind::OBJECT: return "object";
    }
    return "unknown";
}

// numbers keep their literal text so that they can be coerced to any target width without loss
struct Number {
    std::string text;

    bool        operator==(const Number &) const = default;
};

class Value {
public:
    struct Member;
    using Array  = std::vector<Value>;
    using Object = std::vector<Member>; // keeps document order

private:
    // N.B. order of alternatives matches 'Kind'
    std::variant<std::monostate, bool, Number, std::string, Array, Object> _data;

public:
    Value() = default;
    explicit Value(std::nullptr_t) {}
    explicit Value(bool value)
        : _data(value) {}
    explicit Value(Number value)
        : _data(std::move(value)) {}
    explicit Value(std::string value)
        : _data(std::move(value)) {}
    explicit Value(Array value)
        : _data(std::move(value)) {}
    explicit Value(Object value)
        : _data(std::move(value)) {}

    [[nodiscard]] Kind                kind() const noexcept { return static_cast<Kind>(_data.index()); }
    [[nodiscard]] bool                isNull() const noexcept { return kind() == Kind::NUL; }
    [[nodiscard]] bool                isContainer() const noexcept { return kind() == Kind::ARRAY || kind() == Kind::OBJECT; }

    [[nodiscard]] const bool         *asBool() const noexcept { return std::get_if<bool>(&_data); }
    [[nodiscard]] const Number       *asNumber() const noexcept { return std::get_if<Number>(&_data); }
    [[nodiscard]] const std::string  *asString() const noexcept { return std::get_if<std::string>(&_data); }
    [[nodiscard]] const Array        *asArray() const noexcept { return std::get_if<Array>(&_data); }
    [[nodiscard]] const Object       *asObject() const noexcept { return std::get_if<Object>(&_data); }

    // first member named 'key' or nullptr if this is not an object or has no such member
    [[nodiscard]] const Value        *find(std::string_view key) const noexcept;

    [[nodiscard]] std::string         toString() const;

    bool                              operator==(const Value &other) const;
};

struct Value::Member {
    std::string key;
    Value       value;

    bool        operator==(const Member &) const = default;
};

inline const Value *Value::find(std::string_view key) const noexcept {
    if (const auto *object = asObject()) {
        for (const auto &member : *object) {
            if (member.key == key) {
                return &member.value;
            }
        }
    }
    return nullptr;
}

inline bool Value::operator==(const Value &other) const { return _data == other._data; }

namespace detail {
inline void writeString(std::string &out, std::string_view value) {
    out += '"';
    for (const char c : value) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (static_cast<uint8_t>(c) < 0x20) {
                fmt::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
            } else {
                out += c;
            }
        }
    }
    out += '"';
}

inline void writeValue(std::string &out, const Value &value) {
    switch (value.kind()) {
    case Kind::NUL: out += "null"; return;
    case Kind::BOOL: out += *value.asBool() ? "true" : "false"; return;
    case Kind::NUMBER: out += value.asNumber()->text; return;
    case Kind::STRING: writeString(out, *value.asString()); return;
    case Kind::ARRAY: {
        out += '[';
        bool first = true;
        for (const auto &element : *value.asArray()) {
            if (!first) {
                out += ',';
            }
            writeValue(out, element);
            first = false;
        }
        out += ']';
        return;
    }
    case Kind::OBJECT: {
        out += '{';
        bool first = true;
        for (const auto &[key, member] : *value.asObject()) {
            if (!first) {
                out += ',';
            }
            writeString(out, key);
            out += ':';
            writeValue(out, member);
            first = false;
        }
        out += '}';
        return;
    }
    }
}

constexpr inline bool isWhitespace(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }
constexpr inline bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }
constexpr inline int  hexValue(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

inline void appendUtf8(std::string &out, uint32_t codePoint) {
    if (codePoint < 0x80) {
        out += static_cast<char>(codePoint);
    } else if (codePoint < 0x800) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

/**
 * strict recursive-descent JSON (RFC 8259) parser, throws ProtocolException on the first syntax error
 */
class Parser {
    std::string_view  _text;
    std::size_t       _pos = 0;
    const std::size_t _maxDepth;

    [[nodiscard]] bool atEnd() const noexcept { return _pos >= _text.size(); }
    [[nodiscard]] char peek() const noexcept { return atEnd() ? '\0' : _text[_pos]; }

    void               skipWhitespace() noexcept {
        while (!atEnd() && isWhitespace(_text[_pos])) {
            ++_pos;
        }
    }

    void expect(char c) {
        if (peek() != c) {
            throw ProtocolException("expected '{}' at position {} but found {}", c, _pos, describeCurrent());
        }
        ++_pos;
    }

    [[nodiscard]] std::string describeCurrent() const {
        return atEnd() ? std::string{ "end of input" } : fmt::format("'{}'", _text[_pos]);
    }

    Value parseLiteral(std::string_view literal, Value value) {
        if (!_text.substr(_pos).starts_with(literal)) {
            throw ProtocolException("invalid literal at position {}", _pos);
        }
        _pos += literal.size();
        return value;
    }

    Value parseNumber() {
        const auto start = _pos;
        if (peek() == '-') {
            ++_pos;
        }
        if (peek() == '0') {
            ++_pos;
        } else if (isDigit(peek())) {
            while (isDigit(peek())) {
                ++_pos;
            }
        } else {
            throw ProtocolException("invalid number at position {}", start);
        }
        if (peek() == '.') {
            ++_pos;
            if (!isDigit(peek())) {
                throw ProtocolException("missing fraction digits of number at position {}", start);
            }
            while (isDigit(peek())) {
                ++_pos;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            ++_pos;
            if (peek() == '+' || peek() == '-') {
                ++_pos;
            }
            if (!isDigit(peek())) {
                throw ProtocolException("missing exponent digits of number at position {}", start);
            }
            while (isDigit(peek())) {
                ++_pos;
            }
        }
        return Value{ Number{ std::string{ _text.substr(start, _pos - start) } } };
    }

    uint32_t parseHex4() {
        if (_pos + 4 > _text.size()) {
            throw ProtocolException("truncated unicode escape at position {}", _pos);
        }
        uint32_t value = 0;
        for (std::size_t i = 0; i < 4; ++i) {
            const int digit = hexValue(_text[_pos + i]);
            if (digit < 0) {
                throw ProtocolException("illegal hex number {} at position {}", _text.substr(_pos, 4), _pos);
            }
            value = (value << 4) | static_cast<uint32_t>(digit);
        }
        _pos += 4;
        return value;
    }

    std::string parseString() {
        expect('"');
        std::string result;
        while (true) {
            if (atEnd()) {
                throw ProtocolException("unterminated string at position {}", _pos);
            }
            const char c = _text[_pos++];
            if (c == '"') {
                return result;
            }
            if (static_cast<uint8_t>(c) < 0x20) {
                throw ProtocolException("unescaped control character in string at position {}", _pos - 1);
            }
            if (c != '\\') {
                result += c;
                continue;
            }
            const char escaped = atEnd() ? '\0' : _text[_pos++];
            switch (escaped) {
            case '"':
            case '\\':
            case '/': result += escaped; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                uint32_t codePoint = parseHex4();
                if (codePoint >= 0xD800 && codePoint <= 0xDBFF) { // high surrogate, must be followed by a low one
                    if (!_text.substr(_pos).starts_with("\\u")) {
                        throw ProtocolException("unpaired surrogate U+{:04X} at position {}", codePoint, _pos);
                    }
                    _pos += 2;
                    const uint32_t low = parseHex4();
                    if (low < 0xDC00 || low > 0xDFFF) {
                        throw ProtocolException("invalid low surrogate U+{:04X} at position {}", low, _pos);
                    }
                    codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
                } else if (codePoint >= 0xDC00 && codePoint <= 0xDFFF) {
                    throw ProtocolException("unpaired surrogate U+{:04X} at position {}", codePoint, _pos);
                }
                appendUtf8(result, codePoint);
                break;
            }
            default:
                throw ProtocolException("illegal escape character '\\{}' at position {}", escaped, _pos - 1);
            }
        }
    }

    Value parseArray(std::size_t depth) {
        expect('[');
        Value::Array elements;
        skipWhitespace();
        if (peek() == ']') {
            ++_pos;
            return Value{ std::move(elements) };
        }
        while (true) {
            elements.push_back(parseValue(depth));
            skipWhitespace();
            if (peek() == ']') {
                ++_pos;
                return Value{ std::move(elements) };
            }
            expect(',');
        }
    }

    Value parseObject(std::size_t depth) {
        expect('{');
        Value::Object members;
        skipWhitespace();
        if (peek() == '}') {
            ++_pos;
            return Value{ std::move(members) };
        }
        while (true) {
            skipWhitespace();
            auto key = parseString();
            skipWhitespace();
            expect(':');
            members.push_back(Value::Member{ std::move(key), parseValue(depth) });
            skipWhitespace();
            if (peek() == '}') {
                ++_pos;
                return Value{ std::move(members) };
            }
            expect(',');
        }
    }

    Value parseValue(std::size_t depth) {
        skipWhitespace();
        switch (peek()) {
        case '{':
        case '[':
            if (depth >= _maxDepth) {
                throw ProtocolException("nesting depth exceeds limit of {} at position {}", _maxDepth, _pos);
            }
            return peek() == '{' ? parseObject(depth + 1) : parseArray(depth + 1);
        case '"': return Value{ parseString() };
        case 't': return parseLiteral("true", Value{ true });
        case 'f': return parseLiteral("false", Value{ false });
        case 'n': return parseLiteral("null", Value{ nullptr });
        default:
            if (peek() == '-' || isDigit(peek())) {
                return parseNumber();
            }
            throw ProtocolException("unexpected {} at position {}", describeCurrent(), _pos);
        }
    }

public:
    Parser(std::string_view text, std::size_t maxDepth) noexcept
        : _text(text), _maxDepth(maxDepth) {}

    Value parseDocument() {
        auto value = parseValue(0);
        skipWhitespace();
        if (!atEnd()) {
            throw ProtocolException("trailing content {} at position {}", describeCurrent(), _pos);
        }
        return value;
    }
};
} // namespace detail

inline std::string Value::toString() const {
    std::string out;
    detail::writeValue(out, *this);
    return out;
}

/**
 * parses one complete document; on failure the unexpected value holds the syntax error description
 * @param maxDepth maximum number of nested arrays/objects
 */
inline std::expected<Value, std::string> parse(std::string_view text, std::size_t maxDepth = 32) {
    try {
        return detail::Parser(text, maxDepth).parseDocument();
    } catch (const ProtocolException &e) {
        return std::unexpected(std::string{ e.what() });
    }
}

} // namespace document
} // namespace qparam

template<>
struct fmt::formatter<qparam::document::Value> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin(); // not (yet) implemented
    }

    template<typename FormatContext>
    auto format(const qparam::document::Value &value, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", value.toString());
    }
};

#endif // QPARAM_DOCUMENT_HPP
