#ifndef QPARAM_DECODECONFIG_HPP
#define QPARAM_DECODECONFIG_HPP

#include <cstddef>
#include <string_view>

#include <fmt/format.h>

#include <DateFormat.hpp>

namespace qparam {

// how a repeated key is resolved when the target field takes a single value
enum class DuplicateKeyPolicy {
    FIRST, // use the first occurrence
    LAST,  // use the last occurrence
    REJECT // report a TYPE_MISMATCH
};

constexpr std::string_view toString(DuplicateKeyPolicy policy) noexcept {
    switch (policy) {
    case DuplicateKeyPolicy::FIRST: return "FIRST";
    case DuplicateKeyPolicy::LAST: return "LAST";
    case DuplicateKeyPolicy::REJECT: return "REJECT";
    }
    return "UNKNOWN";
}

struct DecodeConfig {
    DateFormat         dateFormat{};
    TimeZone           timeZone       = TimeZone::utc();
    char               arrayDelimiter = ',';
    bool               formEncoding   = false; // '+' decodes to ' '
    DuplicateKeyPolicy duplicateKeys  = DuplicateKeyPolicy::FIRST;
    std::size_t        maxDepth       = 32;    // nesting limit of structured-document values
    bool               logErrors      = false; // log the report of failed top-level decodes via debug::log()
};

inline const DecodeConfig &defaultConfig() {
    static const DecodeConfig config{};
    return config;
}

} // namespace qparam

template<>
struct fmt::formatter<qparam::DuplicateKeyPolicy> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(qparam::DuplicateKeyPolicy policy, FormatContext &ctx) const {
        return fmt::formatter<std::string_view>::format(qparam::toString(policy), ctx);
    }
};

#endif // QPARAM_DECODECONFIG_HPP
