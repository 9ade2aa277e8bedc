#ifndef QPARAM_DATEFORMAT_HPP
#define QPARAM_DATEFORMAT_HPP

#include <chrono>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

namespace qparam {

namespace detail {
constexpr inline bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/**
 * reads exactly 'minDigits' up to 'maxDigits' decimal digits starting at 'pos' and advances 'pos' past them
 * @return the parsed value or -1 if fewer than 'minDigits' digits are present
 */
constexpr int readDigits(std::string_view text, std::size_t &pos, std::size_t minDigits, std::size_t maxDigits) noexcept {
    int         value = 0;
    std::size_t count = 0;
    while (count < maxDigits && pos < text.size() && isDigit(text[pos])) {
        value = 10 * value + (text[pos] - '0');
        ++pos;
        ++count;
    }
    return count < minDigits ? -1 : value;
}

/**
 * parses a zone offset of the form '+hh', '+hhmm' or '+hh:mm' (or '-' respectively) at 'pos'
 */
constexpr std::optional<std::chrono::minutes> readOffset(std::string_view text, std::size_t &pos) noexcept {
    if (pos >= text.size() || (text[pos] != '+' && text[pos] != '-')) {
        return std::nullopt;
    }
    const int sign  = text[pos++] == '-' ? -1 : +1;
    const int hours = readDigits(text, pos, 2, 2);
    if (hours < 0 || hours > 18) {
        return std::nullopt;
    }
    int minutes = 0;
    if (pos < text.size() && text[pos] == ':') {
        ++pos;
        if ((minutes = readDigits(text, pos, 2, 2)) < 0) {
            return std::nullopt;
        }
    } else if (pos < text.size() && isDigit(text[pos])) {
        if ((minutes = readDigits(text, pos, 2, 2)) < 0) {
            return std::nullopt;
        }
    }
    if (minutes > 59) {
        return std::nullopt;
    }
    return std::chrono::minutes{ sign * (60 * hours + minutes) };
}

inline std::string formatOffset(std::chrono::minutes offset, bool withColon) {
    if (offset.count() == 0) {
        return "Z";
    }
    const auto absMinutes = std::abs(offset.count());
    return fmt::format("{}{:02}{}{:02}", offset.count() < 0 ? '-' : '+', absMinutes / 60, withColon ? ":" : "", absMinutes % 60);
}
} // namespace detail

/**
 * A fixed offset from UTC, identified by 'UTC', 'GMT', 'Z', 'Etc/UTC' or an offset like 'UTC+01:00', 'GMT-05', '+0130'.
 */
class TimeZone {
    std::chrono::minutes _offset{ 0 };

    explicit constexpr TimeZone(std::chrono::minutes offset) noexcept
        : _offset(offset) {}

public:
    constexpr TimeZone() noexcept = default;
    explicit TimeZone(std::string_view id) {
        const auto zone = parse(id);
        if (!zone) {
            throw std::invalid_argument(fmt::format("unknown or unsupported time zone id '{}'", id));
        }
        _offset = zone->_offset;
    }

    static constexpr TimeZone utc() noexcept { return TimeZone{ std::chrono::minutes{ 0 } }; }

    static TimeZone fixed(std::chrono::minutes offset) {
        if (std::abs(offset.count()) > 18 * 60) {
            throw std::invalid_argument(fmt::format("time zone offset {} min exceeds +-18 hours", offset.count()));
        }
        return TimeZone{ offset };
    }

    static constexpr std::optional<TimeZone> parse(std::string_view id) noexcept {
        using namespace std::string_view_literals;
        for (const auto alias : { "UTC"sv, "GMT"sv, "Z"sv, "Etc/UTC"sv, "Etc/GMT"sv }) {
            if (id == alias) {
                return utc();
            }
        }
        if (id.starts_with("UTC") || id.starts_with("GMT")) {
            id.remove_prefix(3);
        }
        std::size_t pos    = 0;
        const auto  offset = detail::readOffset(id, pos);
        if (!offset || pos != id.size()) {
            return std::nullopt;
        }
        return TimeZone{ *offset };
    }

    [[nodiscard]] constexpr std::chrono::minutes offset() const noexcept { return _offset; }
    [[nodiscard]] std::string                    name() const {
        if (_offset.count() == 0) {
            return "UTC";
        }
        return fmt::format("UTC{}", detail::formatOffset(_offset, true));
    }

    constexpr bool operator==(const TimeZone &) const noexcept = default;
};

/**
 * Date/time pattern in the common 'yyyy-MM-dd'T'HH:mm:ssZ' notation:
 *
 *   yyyy  four-digit year        (y:  one to four digits)
 *   MM    two-digit month        (M:  one or two digits)
 *   dd    two-digit day of month (d:  one or two digits)
 *   HH    two-digit hour 0-23    (H:  one or two digits)
 *   mm    two-digit minute       (m:  one or two digits)
 *   ss    two-digit second       (s:  one or two digits)
 *   SSS   three-digit milliseconds
 *   Z, X  zone offset, formatted as 'Z' or '+hhmm'; parses 'Z', '+hh', '+hhmm' and '+hh:mm'
 *   XXX   zone offset, formatted as 'Z' or '+hh:mm'
 *   '..'  quoted literal text, '' is a single quote
 *
 * any other non-letter character is literal text. Without a zone field the configured TimeZone applies.
 */
class DateFormat {
public:
    static constexpr std::string_view DEFAULT_PATTERN = "yyyy-MM-dd'T'HH:mm:ssZ";

private:
    enum class FieldType { LITERAL,
        YEAR,
        MONTH,
        DAY,
        HOUR,
        MINUTE,
        SECOND,
        MILLIS,
        ZONE,
        ZONE_COLON };

    struct Field {
        FieldType   type;
        std::size_t width = 0;
        std::string literal{};
    };

    std::string        _pattern;
    std::vector<Field> _fields;

    void               appendLiteral(std::string_view text) {
        if (!_fields.empty() && _fields.back().type == FieldType::LITERAL) {
            _fields.back().literal.append(text);
        } else {
            _fields.push_back(Field{ FieldType::LITERAL, 0, std::string{ text } });
        }
    }

    void appendField(char letter, std::size_t count) {
        const auto require = [&](bool valid) {
            if (!valid) {
                throw std::invalid_argument(fmt::format("unsupported width {} of pattern letter '{}' in date pattern '{}'", count, letter, _pattern));
            }
        };
        switch (letter) {
        case 'y':
            require(count == 1 || count == 4);
            _fields.push_back(Field{ FieldType::YEAR, count });
            return;
        case 'M':
        case 'd':
        case 'H':
        case 'm':
        case 's': {
            require(count <= 2);
            constexpr auto typeOf = [](char c) {
                switch (c) {
                case 'M': return FieldType::MONTH;
                case 'd': return FieldType::DAY;
                case 'H': return FieldType::HOUR;
                case 'm': return FieldType::MINUTE;
                default: return FieldType::SECOND;
                }
            };
            _fields.push_back(Field{ typeOf(letter), count });
            return;
        }
        case 'S':
            require(count == 3);
            _fields.push_back(Field{ FieldType::MILLIS, count });
            return;
        case 'Z':
            require(count <= 3);
            _fields.push_back(Field{ FieldType::ZONE, count });
            return;
        case 'X':
            require(count <= 3);
            _fields.push_back(Field{ count == 3 ? FieldType::ZONE_COLON : FieldType::ZONE, count });
            return;
        default:
            throw std::invalid_argument(fmt::format("unknown pattern letter '{}' in date pattern '{}'", letter, _pattern));
        }
    }

    void compile() {
        const std::string_view pattern = _pattern;
        std::size_t            pos     = 0;
        while (pos < pattern.size()) {
            const char c = pattern[pos];
            if (c == '\'') {
                if (pos + 1 < pattern.size() && pattern[pos + 1] == '\'') {
                    appendLiteral("'");
                    pos += 2;
                    continue;
                }
                std::string literal;
                ++pos;
                while (true) {
                    if (pos >= pattern.size()) {
                        throw std::invalid_argument(fmt::format("unterminated quote in date pattern '{}'", _pattern));
                    }
                    if (pattern[pos] == '\'') {
                        if (pos + 1 < pattern.size() && pattern[pos + 1] == '\'') {
                            literal += '\'';
                            pos += 2;
                            continue;
                        }
                        ++pos;
                        break;
                    }
                    literal += pattern[pos++];
                }
                appendLiteral(literal);
            } else if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
                std::size_t count = 1;
                while (pos + count < pattern.size() && pattern[pos + count] == c) {
                    ++count;
                }
                appendField(c, count);
                pos += count;
            } else {
                appendLiteral(pattern.substr(pos, 1));
                ++pos;
            }
        }
    }

public:
    DateFormat()
        : DateFormat(DEFAULT_PATTERN) {}
    explicit DateFormat(std::string_view pattern)
        : _pattern(pattern) { compile(); }

    [[nodiscard]] const std::string &pattern() const noexcept { return _pattern; }

    template<typename Duration = std::chrono::milliseconds>
    [[nodiscard]] std::optional<std::chrono::sys_time<Duration>> parse(std::string_view text, const TimeZone &zone = TimeZone::utc()) const {
        using namespace std::chrono;
        int                    year = 1970, month = 1, day = 1, hour = 0, minute = 0, second = 0, millis = 0;
        std::optional<minutes> offset;
        std::size_t            pos = 0;

        for (const auto &field : _fields) {
            if (field.type == FieldType::LITERAL) {
                if (!text.substr(pos).starts_with(field.literal)) {
                    return std::nullopt;
                }
                pos += field.literal.size();
                continue;
            }
            if (field.type == FieldType::ZONE || field.type == FieldType::ZONE_COLON) {
                if (pos < text.size() && text[pos] == 'Z') {
                    offset = minutes{ 0 };
                    ++pos;
                } else if (!(offset = detail::readOffset(text, pos))) {
                    return std::nullopt;
                }
                continue;
            }
            const std::size_t maxWidth = field.type == FieldType::YEAR ? 4 : 2;
            const std::size_t minRead  = field.width == 1 ? 1 : field.width;
            const std::size_t maxRead  = field.width == 1 ? maxWidth : field.width;
            const int         value    = detail::readDigits(text, pos, minRead, maxRead);
            if (value < 0) {
                return std::nullopt;
            }
            switch (field.type) {
            case FieldType::YEAR: year = value; break;
            case FieldType::MONTH: month = value; break;
            case FieldType::DAY: day = value; break;
            case FieldType::HOUR: hour = value; break;
            case FieldType::MINUTE: minute = value; break;
            case FieldType::SECOND: second = value; break;
            case FieldType::MILLIS: millis = value; break;
            default: break;
            }
        }
        if (pos != text.size()) {
            return std::nullopt; // trailing characters
        }

        const year_month_day date{ std::chrono::year{ year }, std::chrono::month{ static_cast<unsigned>(month) }, std::chrono::day{ static_cast<unsigned>(day) } };
        if (!date.ok() || hour > 23 || minute > 59 || second > 59) {
            return std::nullopt;
        }
        const sys_time<milliseconds> local = sys_days{ date } + hours{ hour } + minutes{ minute } + seconds{ second } + milliseconds{ millis };
        return floor<Duration>(local - offset.value_or(zone.offset()));
    }

    template<typename Duration>
    [[nodiscard]] std::string format(std::chrono::sys_time<Duration> timeStamp, const TimeZone &zone = TimeZone::utc()) const {
        using namespace std::chrono;
        const auto           local = floor<milliseconds>(timeStamp) + zone.offset();
        const auto           midnight = floor<days>(local);
        const year_month_day date{ midnight };
        const hh_mm_ss       time{ local - midnight };

        std::string          result;
        for (const auto &field : _fields) {
            const auto number = [&](auto value) {
                if (field.width == 1) {
                    fmt::format_to(std::back_inserter(result), "{}", value);
                } else {
                    fmt::format_to(std::back_inserter(result), "{:0{}}", value, field.width);
                }
            };
            switch (field.type) {
            case FieldType::LITERAL: result.append(field.literal); break;
            case FieldType::YEAR: number(static_cast<int>(date.year())); break;
            case FieldType::MONTH: number(static_cast<unsigned>(date.month())); break;
            case FieldType::DAY: number(static_cast<unsigned>(date.day())); break;
            case FieldType::HOUR: number(time.hours().count()); break;
            case FieldType::MINUTE: number(time.minutes().count()); break;
            case FieldType::SECOND: number(time.seconds().count()); break;
            case FieldType::MILLIS: number(time.subseconds().count()); break;
            case FieldType::ZONE: result.append(detail::formatOffset(zone.offset(), false)); break;
            case FieldType::ZONE_COLON: result.append(detail::formatOffset(zone.offset(), true)); break;
            }
        }
        return result;
    }

    bool operator==(const DateFormat &other) const noexcept { return _pattern == other._pattern; }
};

} // namespace qparam

#endif // QPARAM_DATEFORMAT_HPP
