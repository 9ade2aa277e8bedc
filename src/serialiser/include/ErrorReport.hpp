#ifndef QPARAM_ERRORREPORT_HPP
#define QPARAM_ERRORREPORT_HPP

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace qparam {

enum class DecodeErrorKind {
    MISSING_VALUE,      // required field absent
    TYPE_MISMATCH,      // value present but not of the expected kind
    MALFORMED_ARRAY,    // at least one element of an array value failed
    MALFORMED_DOCUMENT, // structured-document literal with syntax errors
    MALFORMED_DATE,     // value does not match the configured date format
    INDEX_OUT_OF_RANGE  // element requested past the end of an unkeyed container
};

constexpr std::string_view toString(DecodeErrorKind kind) noexcept {
    switch (kind) {
    case DecodeErrorKind::MISSING_VALUE: return "MISSING_VALUE";
    case DecodeErrorKind::TYPE_MISMATCH: return "TYPE_MISMATCH";
    case DecodeErrorKind::MALFORMED_ARRAY: return "MALFORMED_ARRAY";
    case DecodeErrorKind::MALFORMED_DOCUMENT: return "MALFORMED_DOCUMENT";
    case DecodeErrorKind::MALFORMED_DATE: return "MALFORMED_DATE";
    case DecodeErrorKind::INDEX_OUT_OF_RANGE: return "INDEX_OUT_OF_RANGE";
    }
    return "UNKNOWN";
}

/**
 * keys and indices traversed from the root to the current container, rendered as 'a.b[2].c'
 */
class DecodePath {
    using Segment = std::variant<std::string, std::size_t>;
    std::vector<Segment> _segments;

public:
    DecodePath() = default;

    [[nodiscard]] DecodePath child(std::string_view key) const {
        DecodePath path = *this;
        path._segments.emplace_back(std::string{ key });
        return path;
    }

    [[nodiscard]] DecodePath element(std::size_t index) const {
        DecodePath path = *this;
        path._segments.emplace_back(index);
        return path;
    }

    [[nodiscard]] bool        isRoot() const noexcept { return _segments.empty(); }
    [[nodiscard]] std::size_t depth() const noexcept { return _segments.size(); }

    [[nodiscard]] std::string toString() const {
        std::string result;
        for (const auto &segment : _segments) {
            if (const auto *key = std::get_if<std::string>(&segment)) {
                if (!result.empty()) {
                    result += '.';
                }
                result += *key;
            } else {
                result += fmt::format("[{}]", std::get<std::size_t>(segment));
            }
        }
        return result;
    }

    bool operator==(const DecodePath &) const = default;
    bool operator==(std::string_view rendered) const { return toString() == rendered; }
};

struct DecodeError {
    DecodeErrorKind          kind;
    DecodePath               path;
    std::string              expected{}; // expected kind, for TYPE_MISMATCH
    std::string              rawValue{}; // offending raw value, if any
    std::vector<DecodeError> causes{};   // element failures of a MALFORMED_ARRAY

    [[nodiscard]] std::string message() const {
        const auto location = path.isRoot() ? std::string{ "<root>" } : path.toString();
        switch (kind) {
        case DecodeErrorKind::MISSING_VALUE:
            return fmt::format("{} at '{}': required value is missing", toString(kind), location);
        case DecodeErrorKind::TYPE_MISMATCH:
            return fmt::format("{} at '{}': expected {} but got '{}'", toString(kind), location, expected, rawValue);
        case DecodeErrorKind::INDEX_OUT_OF_RANGE:
            return fmt::format("{} at '{}': {}", toString(kind), location, expected.empty() ? std::string{ "no more elements" } : expected);
        case DecodeErrorKind::MALFORMED_ARRAY: {
            if (causes.empty()) {
                return fmt::format("{} at '{}': '{}' - expected {}", toString(kind), location, rawValue, expected);
            }
            std::vector<std::string> causeMessages;
            causeMessages.reserve(causes.size());
            for (const auto &cause : causes) {
                causeMessages.push_back(cause.message());
            }
            return fmt::format("{} at '{}': '{}' caused by [{}]", toString(kind), location, rawValue, fmt::join(causeMessages, "; "));
        }
        case DecodeErrorKind::MALFORMED_DOCUMENT:
        case DecodeErrorKind::MALFORMED_DATE:
        default:
            return fmt::format("{} at '{}': '{}'{}{}", toString(kind), location, rawValue, expected.empty() ? "" : " - ", expected);
        }
    }

    bool operator==(const DecodeError &) const = default;
};

/**
 * all failures of one decode invocation, each tagged with its path, in detection order
 */
class ErrorReport {
    std::vector<DecodeError> _errors;

public:
    ErrorReport() = default;
    explicit ErrorReport(DecodeError error) { _errors.push_back(std::move(error)); }

    void                                          add(DecodeError error) { _errors.push_back(std::move(error)); }
    void                                          merge(ErrorReport other) { std::ranges::move(other._errors, std::back_inserter(_errors)); }

    [[nodiscard]] bool                            empty() const noexcept { return _errors.empty(); }
    [[nodiscard]] std::size_t                     size() const noexcept { return _errors.size(); }
    [[nodiscard]] const std::vector<DecodeError> &errors() const noexcept { return _errors; }
    [[nodiscard]] std::vector<DecodeError>       &errors() noexcept { return _errors; }
    [[nodiscard]] auto                            begin() const noexcept { return _errors.cbegin(); }
    [[nodiscard]] auto                            end() const noexcept { return _errors.cend(); }

    [[nodiscard]] bool                            contains(DecodeErrorKind kind, std::string_view path) const {
        return std::ranges::any_of(_errors, [&](const DecodeError &error) { return error.kind == kind && error.path == path; });
    }

    [[nodiscard]] const DecodeError *find(std::string_view path) const {
        const auto it = std::ranges::find_if(_errors, [&](const DecodeError &error) { return error.path == path; });
        return it == _errors.end() ? nullptr : &*it;
    }

    [[nodiscard]] std::string message() const {
        std::vector<std::string> messages;
        messages.reserve(_errors.size());
        for (const auto &error : _errors) {
            messages.push_back(error.message());
        }
        return fmt::format("{} decode error{}: {}", _errors.size(), _errors.size() == 1 ? "" : "s", fmt::join(messages, "; "));
    }

    bool operator==(const ErrorReport &) const = default;
};

class DecodeException : public std::runtime_error {
    ErrorReport _report;

public:
    explicit DecodeException(ErrorReport report)
        : std::runtime_error(report.message()), _report(std::move(report)) {}

    [[nodiscard]] const ErrorReport &report() const noexcept { return _report; }
};

inline std::ostream &operator<<(std::ostream &os, DecodeErrorKind kind) { return os << toString(kind); }
inline std::ostream &operator<<(std::ostream &os, const DecodePath &path) { return os << path.toString(); }
inline std::ostream &operator<<(std::ostream &os, const DecodeError &error) { return os << error.message(); }
inline std::ostream &operator<<(std::ostream &os, const ErrorReport &report) { return os << report.message(); }

} // namespace qparam

template<>
struct fmt::formatter<qparam::DecodeErrorKind> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(qparam::DecodeErrorKind kind, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(qparam::toString(kind), ctx);
    }
};

template<>
struct fmt::formatter<qparam::DecodePath> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const qparam::DecodePath &path, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(path.toString(), ctx);
    }
};

template<>
struct fmt::formatter<qparam::DecodeError> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const qparam::DecodeError &error, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(error.message(), ctx);
    }
};

template<>
struct fmt::formatter<qparam::ErrorReport> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const qparam::ErrorReport &report, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(report.message(), ctx);
    }
};

#endif // QPARAM_ERRORREPORT_HPP
