#ifndef QPARAM_PARAMETERMAP_HPP
#define QPARAM_PARAMETERMAP_HPP

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <QueryString.hpp>

namespace qparam {

struct ParameterEntry {
    std::string              key;
    std::vector<std::string> values; // never empty, in arrival order

    bool                     operator==(const ParameterEntry &) const = default;
};

/**
 * Immutable key -> ordered raw values view of one query string.
 * Repeated keys are preserved (their values are appended, not collapsed) and iteration follows
 * the first-seen order of the keys.
 */
class ParameterMap {
    std::vector<ParameterEntry>                         _entries;
    std::map<std::string, std::size_t, std::less<>>     _index;

public:
    ParameterMap() = default;
    explicit ParameterMap(std::vector<query::QueryPair> pairs) {
        for (auto &[key, value] : pairs) {
            if (const auto it = _index.find(key); it != _index.end()) {
                _entries[it->second].values.emplace_back(std::move(value));
                continue;
            }
            _index.emplace(key, _entries.size());
            _entries.push_back(ParameterEntry{ std::move(key), { std::move(value) } });
        }
    }

    static ParameterMap parse(std::string_view query, bool formEncoding = false) {
        return ParameterMap(query::tokenize(query, formEncoding));
    }

    [[nodiscard]] const ParameterEntry *find(std::string_view key) const noexcept {
        const auto it = _index.find(key);
        return it == _index.end() ? nullptr : &_entries[it->second];
    }

    [[nodiscard]] bool                     contains(std::string_view key) const noexcept { return _index.contains(key); }
    [[nodiscard]] std::size_t              size() const noexcept { return _entries.size(); }
    [[nodiscard]] bool                     empty() const noexcept { return _entries.empty(); }
    [[nodiscard]] auto                     begin() const noexcept { return _entries.cbegin(); }
    [[nodiscard]] auto                     end() const noexcept { return _entries.cend(); }

    [[nodiscard]] std::vector<std::string> keys() const {
        std::vector<std::string> result;
        result.reserve(_entries.size());
        for (const auto &entry : _entries) {
            result.push_back(entry.key);
        }
        return result;
    }

    bool operator==(const ParameterMap &other) const noexcept { return _entries == other._entries; }
};

} // namespace qparam

template<>
struct fmt::formatter<qparam::ParameterMap> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) {
        return ctx.begin(); // not (yet) implemented
    }

    template<typename FormatContext>
    auto format(const qparam::ParameterMap &map, FormatContext &ctx) const {
        auto out   = fmt::format_to(ctx.out(), "{{");
        bool first = true;
        for (const auto &entry : map) {
            out   = fmt::format_to(out, "{}{}: {}", first ? "" : ", ", entry.key, entry.values);
            first = false;
        }
        return fmt::format_to(out, "}}");
    }
};

namespace qparam {
inline std::ostream &operator<<(std::ostream &os, const ParameterMap &map) {
    return os << fmt::format("{}", map);
}
} // namespace qparam

#endif // QPARAM_PARAMETERMAP_HPP
