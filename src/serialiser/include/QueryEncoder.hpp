#ifndef QPARAM_QUERYENCODER_HPP
#define QPARAM_QUERYENCODER_HPP

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <refl.hpp>

#include <QueryString.hpp>
#include <qparam.hpp>

#include <DecodeConfig.hpp>
#include <Document.hpp>
#include <DocumentBridge.hpp>
#include <ScalarCoercer.hpp>

namespace qparam {

namespace detail {

// '%' of a document literal is escaped once more since the document bridge percent-decodes a second time
inline std::string escapeDocumentLiteral(std::string_view literal) {
    std::string escaped;
    escaped.reserve(literal.size());
    for (const char c : literal) {
        if (c == '%') {
            escaped += "%25";
        } else {
            escaped += c;
        }
    }
    return escaped;
}

template<typename T>
document::Value toDocument(const T &value, const DecodeConfig &config) {
    if constexpr (AnnotatedType<T>) {
        return toDocument(value.value(), config);
    } else if constexpr (OptionalType<T> || SmartPointerType<T>) {
        return value ? toDocument(*value, config) : document::Value{ nullptr };
    } else if constexpr (std::is_same_v<T, bool>) {
        return document::Value{ value };
    } else if constexpr (Number<T>) {
        return document::Value{ document::Number{ ScalarCoercer<T>::render(value, config) } };
    } else if constexpr (StringLike<T> || TimePoint<T>) {
        return document::Value{ ScalarCoercer<T>::render(value, config) };
    } else if constexpr (ArrayOrVector<T>) {
        document::Value::Array elements;
        elements.reserve(value.size());
        for (const auto &element : value) {
            elements.push_back(toDocument(element, config));
        }
        return document::Value{ std::move(elements) };
    } else if constexpr (ReflectableClass<T>) {
        document::Value::Object members;
        for_each(refl::reflect<T>().members, [&](const auto member, [[maybe_unused]] const auto index) {
            if constexpr (is_field(member) && !is_static(member)) {
                const auto &field = getAnnotatedMember(member(value));
                using FieldType   = std::remove_cvref_t<decltype(field)>;
                if constexpr (OptionalType<FieldType> || SmartPointerType<FieldType>) {
                    if (!field) {
                        return; // absent fields decode as empty
                    }
                }
                members.push_back(document::Value::Member{ std::string{ member.name.c_str() }, toDocument(field, config) });
            }
        });
        return document::Value{ std::move(members) };
    } else {
        static_assert(always_false<T>, "don't know how to encode this type");
        return document::Value{};
    }
}

template<typename T>
void serialiseField(std::vector<query::QueryPair> &pairs, std::string_view key, const T &value, const DecodeConfig &config) {
    if constexpr (AnnotatedType<T>) {
        serialiseField(pairs, key, value.value(), config);
    } else if constexpr (OptionalType<T> || SmartPointerType<T>) {
        if (value) {
            serialiseField(pairs, key, *value, config);
        }
    } else if constexpr (Scalar<T>) {
        pairs.push_back(query::QueryPair{ std::string{ key }, ScalarCoercer<T>::render(value, config) });
    } else if constexpr (ArrayOrVector<T> && Scalar<typename T::value_type>) {
        std::vector<std::string> rendered;
        rendered.reserve(value.size());
        for (const auto &element : value) {
            rendered.push_back(ScalarCoercer<typename T::value_type>::render(element, config));
        }
        const auto isPlain = [&config](const std::string &element) { return element.find(config.arrayDelimiter) == std::string::npos && !looksLikeDocument(element); };
        if (!rendered.empty() && std::ranges::all_of(rendered, isPlain)) {
            pairs.push_back(query::QueryPair{ std::string{ key }, fmt::format("{}", fmt::join(rendered, std::string_view{ &config.arrayDelimiter, 1 })) });
        } else if (rendered.size() > 1) {
            for (auto &element : rendered) { // one repeated key per element
                pairs.push_back(query::QueryPair{ std::string{ key }, std::move(element) });
            }
        } else {
            pairs.push_back(query::QueryPair{ std::string{ key }, escapeDocumentLiteral(toDocument(value, config).toString()) });
        }
    } else {
        pairs.push_back(query::QueryPair{ std::string{ key }, escapeDocumentLiteral(toDocument(value, config).toString()) });
    }
}

} // namespace detail

/**
 * inverse of decode(..): one (key, raw value) pair per field of 'value' in declaration order, before
 * percent-encoding. Empty optional and null pointer fields are omitted.
 */
template<ReflectableClass C>
std::vector<query::QueryPair> serialise(const C &value, const DecodeConfig &config = defaultConfig()) {
    std::vector<query::QueryPair> pairs;
    for_each(refl::reflect<C>().members, [&](const auto member, [[maybe_unused]] const auto index) {
        if constexpr (is_field(member) && !is_static(member)) {
            detail::serialiseField(pairs, member.name.c_str(), member(value), config);
        }
    });
    return pairs;
}

/**
 * percent-encoded query string (without leading '?') such that decode<C>(encode(x)) == x. Throws std::invalid_argument
 * if a time point field is finer than the configured date pattern, since it would not decode to the same value.
 */
template<ReflectableClass C>
std::string encode(const C &value, const DecodeConfig &config = defaultConfig()) {
    std::vector<std::string> pairs;
    for (const auto &[key, rawValue] : serialise(value, config)) {
        pairs.push_back(fmt::format("{}={}", query::encode(key), query::encode(rawValue)));
    }
    return fmt::format("{}", fmt::join(pairs, "&"));
}

} // namespace qparam

#endif // QPARAM_QUERYENCODER_HPP
