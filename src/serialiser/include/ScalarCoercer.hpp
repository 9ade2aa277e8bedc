#ifndef QPARAM_SCALARCOERCER_HPP
#define QPARAM_SCALARCOERCER_HPP

#include <array>
#include <charconv>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

#include <fast_float/fast_float.h>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <qparam.hpp>

#include <DecodeConfig.hpp>

namespace qparam {

/**
 * Total parse of one raw query value into a scalar type and its inverse.
 *
 * coerce(..) never throws: it either consumes the whole string or returns std::nullopt.
 * render(..) produces the canonical literal so that coerce(render(x)) == x. It throws std::invalid_argument for a
 * time point the configured date pattern cannot represent exactly, e.g. sub-second values without an 'SSS' field.
 */
template<typename T>
struct ScalarCoercer {
    static std::optional<T> coerce(std::string_view, const DecodeConfig &) {
        static_assert(always_false<T>, "don't know how to coerce this type");
        return std::nullopt;
    }
};

template<>
struct ScalarCoercer<bool> {
    static std::optional<bool> coerce(std::string_view raw, const DecodeConfig & /*config*/) noexcept {
        if (raw == "true") {
            return true;
        }
        if (raw == "false") {
            return false;
        }
        return std::nullopt; // neither '1'/'0' nor 'yes'/'no' or any other case variant
    }

    static std::string render(bool value, const DecodeConfig & /*config*/) { return value ? "true" : "false"; }
};

template<Integer T>
struct ScalarCoercer<T> {
    static std::optional<T> coerce(std::string_view raw, const DecodeConfig & /*config*/) noexcept {
        if (raw.starts_with('+')) {
            raw.remove_prefix(1);
            if (raw.starts_with('-') || raw.starts_with('+')) {
                return std::nullopt;
            }
        }
        T          value{};
        const auto result = std::from_chars(raw.data(), raw.data() + raw.size(), value);
        if (raw.empty() || result.ec != std::errc() || result.ptr != raw.data() + raw.size()) {
            return std::nullopt;
        }
        return value;
    }

    static std::string render(T value, const DecodeConfig & /*config*/) { return fmt::format("{}", value); }
};

template<FloatingPoint T>
struct ScalarCoercer<T> {
    static std::optional<T> coerce(std::string_view raw, const DecodeConfig & /*config*/) noexcept {
        if (raw.starts_with('+')) {
            raw.remove_prefix(1);
            if (raw.starts_with('-') || raw.starts_with('+')) {
                return std::nullopt;
            }
        }
        if (raw.empty() || raw.front() == ' ' || raw.front() == '\t' || raw.front() == '\n' || raw.front() == '\r') {
            return std::nullopt;
        }
        T          value{};
        const auto result = fast_float::from_chars(raw.data(), raw.data() + raw.size(), value);
        if (result.ec != std::errc() || result.ptr != raw.data() + raw.size()) {
            return std::nullopt;
        }
        return value;
    }

    static std::string render(T value, const DecodeConfig & /*config*/) {
        std::array<char, 32> buffer{};
        const auto           result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value); // shortest round-trip representation
        return std::string{ buffer.data(), result.ptr };
    }
};

template<StringLike T>
struct ScalarCoercer<T> {
    static std::optional<T> coerce(std::string_view raw, const DecodeConfig & /*config*/) { return T{ raw }; }

    static std::string      render(const T &value, const DecodeConfig & /*config*/) { return std::string{ value }; }
};

template<TimePoint T>
struct ScalarCoercer<T> {
    using Duration = typename T::duration;

    static std::optional<T> coerce(std::string_view raw, const DecodeConfig &config) {
        return config.dateFormat.template parse<Duration>(raw, config.timeZone);
    }

    static std::string render(const T &value, const DecodeConfig &config) {
        auto rendered = config.dateFormat.format(value, config.timeZone);
        if (config.dateFormat.template parse<Duration>(rendered, config.timeZone) != value) {
            throw std::invalid_argument(fmt::format("date pattern '{}' cannot represent {} exactly, rendered as '{}'", config.dateFormat.pattern(), value.time_since_epoch(), rendered));
        }
        return rendered;
    }
};

template<typename T>
concept Scalar = std::is_same_v<std::remove_cvref_t<T>, bool> || Integer<T> || FloatingPoint<T> || StringLike<T> || TimePoint<T>;

template<Scalar T>
std::optional<T> coerce(std::string_view raw, const DecodeConfig &config = defaultConfig()) {
    return ScalarCoercer<T>::coerce(raw, config);
}

template<Scalar T>
std::string render(const T &value, const DecodeConfig &config = defaultConfig()) {
    return ScalarCoercer<T>::render(value, config);
}

} // namespace qparam

#endif // QPARAM_SCALARCOERCER_HPP
