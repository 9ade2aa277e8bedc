#ifndef QPARAM_QUERYDECODER_HPP
#define QPARAM_QUERYDECODER_HPP

#include <concepts>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <refl.hpp>

#include <Debug.hpp>
#include <ParameterMap.hpp>
#include <qparam.hpp>

#include <ArraySplitter.hpp>
#include <DecodeConfig.hpp>
#include <Document.hpp>
#include <DocumentBridge.hpp>
#include <ErrorReport.hpp>
#include <ScalarCoercer.hpp>

namespace qparam {

template<typename T>
using DecodeOutcome = std::expected<T, ErrorReport>;

class KeyedContainer;
class UnkeyedContainer;
class SingleValueContainer;

/**
 * Explicit decode logic of a type, as an alternative to the field-by-field decoding of types declared with
 * QPARAM_REFLECT. A specialisation provides one of
 *
 *   static T decode(KeyedContainer &container);       // object-like: named fields
 *   static T decode(UnkeyedContainer &container);     // array-like: ordered elements
 *   static T decode(SingleValueContainer &container); // one leaf value
 *
 * Failures are reported through the container; the returned value is discarded if any were reported.
 */
template<typename T>
struct QueryDecodable {};

template<typename T>
concept KeyedDecodable = requires(KeyedContainer &container) {
    { QueryDecodable<T>::decode(container) } -> std::convertible_to<T>;
};

template<typename T>
concept UnkeyedDecodable = requires(UnkeyedContainer &container) {
    { QueryDecodable<T>::decode(container) } -> std::convertible_to<T>;
};

template<typename T>
concept SingleValueDecodable = requires(SingleValueContainer &container) {
    { QueryDecodable<T>::decode(container) } -> std::convertible_to<T>;
};

template<typename T>
concept CustomDecodable = KeyedDecodable<T> || UnkeyedDecodable<T> || SingleValueDecodable<T>;

namespace detail {

// all raw values of one query key (or one element thereof), never empty when created by the engine
struct RawValues {
    std::span<const std::string> values;
};

using KeyedSource = std::variant<const ParameterMap *, const document::Value *>;
using Node        = std::variant<const ParameterMap *, RawValues, const document::Value *>;

struct DecodeContext {
    const DecodeConfig &config;
    ErrorReport        &report;
};

template<typename T>
std::optional<T> decodeValue(const Node &node, const DecodePath &path, DecodeContext &ctx);

inline void      addError(DecodeContext &ctx, DecodeErrorKind kind, const DecodePath &path, std::string expected = {}, std::string rawValue = {}) {
    ctx.report.add(DecodeError{ kind, path, std::move(expected), std::move(rawValue) });
}

inline bool isNullNode(const Node &node) noexcept {
    const auto *value = std::get_if<const document::Value *>(&node);
    return value != nullptr && (*value)->isNull();
}

// raw text of a node for error reports
inline std::string describe(const Node &node) {
    if (const auto *raw = std::get_if<RawValues>(&node)) {
        return raw->values.empty() ? std::string{} : raw->values.front();
    }
    if (const auto *value = std::get_if<const document::Value *>(&node)) {
        const auto *string = (*value)->asString();
        return string != nullptr ? *string : (*value)->toString();
    }
    return {};
}

/**
 * picks the one raw value a single-valued target is decoded from, according to the duplicate-key policy
 */
inline const std::string *selectRaw(const RawValues &raw, const DecodePath &path, DecodeContext &ctx, std::string_view expected) {
    if (raw.values.empty()) {
        addError(ctx, DecodeErrorKind::MISSING_VALUE, path);
        return nullptr;
    }
    if (raw.values.size() == 1 || ctx.config.duplicateKeys == DuplicateKeyPolicy::FIRST) {
        return &raw.values.front();
    }
    if (ctx.config.duplicateKeys == DuplicateKeyPolicy::LAST) {
        return &raw.values.back();
    }
    addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, fmt::format("{} (single value)", expected), fmt::format("{}", fmt::join(raw.values, "&")));
    return nullptr;
}

// storage of a document parsed on the fly, must outlive the containers created from it
struct Scope {
    std::optional<document::Value> document;
    KeyedSource                    source;
};

/**
 * resolves the node a composite (object-like) target is decoded from: the top-level parameter map,
 * a nested document object, or a raw value holding an object literal
 */
inline bool resolveKeyed(const Node &node, const DecodePath &path, DecodeContext &ctx, std::string_view expected, Scope &scope) {
    if (const auto *map = std::get_if<const ParameterMap *>(&node)) {
        scope.source = *map;
        return true;
    }
    if (const auto *value = std::get_if<const document::Value *>(&node)) {
        if ((*value)->kind() != document::Kind::OBJECT) {
            addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, std::string{ expected }, (*value)->toString());
            return false;
        }
        scope.source = *value;
        return true;
    }
    const auto *raw = selectRaw(std::get<RawValues>(node), path, ctx, expected);
    if (raw == nullptr) {
        return false;
    }
    if (!looksLikeDocument(*raw)) {
        addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, std::string{ expected }, *raw);
        return false;
    }
    auto parsed = parseDocumentParameter(*raw, ctx.config.maxDepth);
    if (!parsed) {
        addError(ctx, DecodeErrorKind::MALFORMED_DOCUMENT, path, std::move(parsed.error()), *raw);
        return false;
    }
    if (parsed->kind() != document::Kind::OBJECT) {
        addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, std::string{ expected }, *raw);
        return false;
    }
    scope.document = std::move(*parsed);
    scope.source   = &*scope.document;
    return true;
}

// element nodes of an array-like target and the storage they point into
struct Elements {
    std::vector<std::string>       split;
    std::optional<document::Value> document;
    std::vector<Node>              nodes;
    std::string                    raw;
};

inline bool collectDocumentElements(const document::Value &value, const DecodePath &path, DecodeContext &ctx, std::string_view expected, Elements &elements) {
    const auto *array = value.asArray();
    if (array == nullptr) {
        addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, std::string{ expected }, value.toString());
        return false;
    }
    elements.nodes.reserve(array->size());
    for (const auto &element : *array) {
        elements.nodes.emplace_back(&element);
    }
    return true;
}

/**
 * Repeated keys give one element per occurrence, a single array literal is parsed as document and any
 * other single value is split on the configured delimiter.
 */
inline bool collectElements(const Node &node, const DecodePath &path, DecodeContext &ctx, std::string_view expected, Elements &elements) {
    if (const auto *value = std::get_if<const document::Value *>(&node)) {
        elements.raw = (*value)->toString();
        return collectDocumentElements(**value, path, ctx, expected, elements);
    }
    const auto *raw = std::get_if<RawValues>(&node);
    if (raw == nullptr) {
        addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, std::string{ expected });
        return false;
    }
    if (raw->values.empty()) {
        addError(ctx, DecodeErrorKind::MISSING_VALUE, path);
        return false;
    }
    if (raw->values.size() > 1) {
        elements.raw = fmt::format("{}", fmt::join(raw->values, std::string_view{ &ctx.config.arrayDelimiter, 1 }));
        elements.nodes.reserve(raw->values.size());
        for (const auto &value : raw->values) {
            elements.nodes.emplace_back(RawValues{ std::span<const std::string>{ &value, 1 } });
        }
        return true;
    }

    const auto &value = raw->values.front();
    elements.raw      = value;
    if (looksLikeDocument(value)) {
        auto parsed = parseDocumentParameter(value, ctx.config.maxDepth);
        if (!parsed) {
            addError(ctx, DecodeErrorKind::MALFORMED_DOCUMENT, path, std::move(parsed.error()), value);
            return false;
        }
        elements.document = std::move(*parsed);
        return collectDocumentElements(*elements.document, path, ctx, expected, elements);
    }
    elements.split = splitArray(value, ctx.config.arrayDelimiter);
    elements.nodes.reserve(elements.split.size());
    for (const auto &element : elements.split) {
        elements.nodes.emplace_back(RawValues{ std::span<const std::string>{ &element, 1 } });
    }
    return true;
}

} // namespace detail

/**
 * object-like view of the top-level parameter map or of a nested document object
 */
class KeyedContainer {
    detail::KeyedSource    _source;
    DecodePath             _path;
    detail::DecodeContext &_ctx;

    [[nodiscard]] std::optional<detail::Node> child(std::string_view key) const {
        if (const auto *map = std::get_if<const ParameterMap *>(&_source)) {
            if (const auto *entry = (*map)->find(key)) {
                return detail::Node{ detail::RawValues{ entry->values } };
            }
            return std::nullopt;
        }
        if (const auto *value = std::get<const document::Value *>(_source)->find(key)) {
            return detail::Node{ value };
        }
        return std::nullopt;
    }

public:
    KeyedContainer(detail::KeyedSource source, DecodePath path, detail::DecodeContext &ctx)
        : _source(source), _path(std::move(path)), _ctx(ctx) {}

    [[nodiscard]] bool contains(std::string_view key) const { return child(key).has_value(); }

    [[nodiscard]] std::vector<std::string> keys() const {
        if (const auto *map = std::get_if<const ParameterMap *>(&_source)) {
            return (*map)->keys();
        }
        std::vector<std::string> result;
        for (const auto &member : *std::get<const document::Value *>(_source)->asObject()) {
            result.push_back(member.key);
        }
        return result;
    }

    [[nodiscard]] const DecodePath   &codingPath() const noexcept { return _path; }
    [[nodiscard]] const DecodeConfig &config() const noexcept { return _ctx.config; }

    /**
     * decodes field 'key' into 'value'. An absent key leaves optional and smart-pointer targets empty and is a
     * MISSING_VALUE failure otherwise.
     * @return false if a failure was reported, 'value' is left untouched in that case
     */
    template<typename T>
    bool decode(std::string_view key, T &value) {
        const auto node = child(key);
        if (!node) {
            if constexpr (OptionalType<T> || SmartPointerType<T>) {
                value = T{};
                return true;
            } else {
                detail::addError(_ctx, DecodeErrorKind::MISSING_VALUE, _path.child(key));
                return false;
            }
        }
        auto result = detail::decodeValue<T>(*node, _path.child(key), _ctx);
        if (!result) {
            return false;
        }
        value = std::move(*result);
        return true;
    }

    // value-initialised T if the field is absent or invalid, the failure is recorded in the report
    template<typename T>
    T decode(std::string_view key) {
        T value{};
        if (!decode(key, value)) {
            return T{};
        }
        return value;
    }

    // std::nullopt if the field is absent, null or invalid (only the latter is recorded as failure)
    template<typename T>
    std::optional<T> decodeIfPresent(std::string_view key) {
        const auto node = child(key);
        if (!node || detail::isNullNode(*node)) {
            return std::nullopt;
        }
        return detail::decodeValue<T>(*node, _path.child(key), _ctx);
    }
};

/**
 * forward-only cursor over the elements of an array value
 */
class UnkeyedContainer {
    std::span<const detail::Node> _elements;
    DecodePath                    _path;
    detail::DecodeContext        &_ctx;
    std::size_t                   _index = 0;

public:
    UnkeyedContainer(std::span<const detail::Node> elements, DecodePath path, detail::DecodeContext &ctx)
        : _elements(elements), _path(std::move(path)), _ctx(ctx) {}

    [[nodiscard]] std::size_t         count() const noexcept { return _elements.size(); }
    [[nodiscard]] std::size_t         currentIndex() const noexcept { return _index; }
    [[nodiscard]] bool                isAtEnd() const noexcept { return _index >= _elements.size(); }
    [[nodiscard]] const DecodePath   &codingPath() const noexcept { return _path; }
    [[nodiscard]] const DecodeConfig &config() const noexcept { return _ctx.config; }

    // decodes the element at the cursor and advances, INDEX_OUT_OF_RANGE when exhausted
    template<typename T>
    T decodeNext() {
        if (isAtEnd()) {
            detail::addError(_ctx, DecodeErrorKind::INDEX_OUT_OF_RANGE, _path.element(_index), fmt::format("element requested but only {} available", _elements.size()));
            return T{};
        }
        const auto index  = _index++;
        auto       result = detail::decodeValue<T>(_elements[index], _path.element(index), _ctx);
        if (!result) {
            return T{};
        }
        return std::move(*result);
    }
};

/**
 * terminal leaf: exactly one raw string or one document scalar
 */
class SingleValueContainer {
    const detail::Node    &_node;
    DecodePath             _path;
    detail::DecodeContext &_ctx;

public:
    SingleValueContainer(const detail::Node &node, DecodePath path, detail::DecodeContext &ctx)
        : _node(node), _path(std::move(path)), _ctx(ctx) {}

    [[nodiscard]] const DecodePath   &codingPath() const noexcept { return _path; }
    [[nodiscard]] const DecodeConfig &config() const noexcept { return _ctx.config; }
    [[nodiscard]] bool                isNull() const noexcept { return detail::isNullNode(_node); }

    // the held value as text without reporting anything (the last occurrence for DuplicateKeyPolicy::LAST).
    // Repeated values never reach a single-value decodable under DuplicateKeyPolicy::REJECT.
    [[nodiscard]] std::optional<std::string> rawValue() const {
        if (const auto *raw = std::get_if<detail::RawValues>(&_node)) {
            if (raw->values.empty()) {
                return std::nullopt;
            }
            return _ctx.config.duplicateKeys == DuplicateKeyPolicy::LAST ? raw->values.back() : raw->values.front();
        }
        if (std::holds_alternative<const document::Value *>(_node)) {
            return detail::describe(_node);
        }
        return std::nullopt;
    }

    // value-initialised T on failure, TYPE_MISMATCH if T does not match the held kind
    template<typename T>
    T decode() {
        auto result = detail::decodeValue<T>(_node, _path, _ctx);
        if (!result) {
            return T{};
        }
        return std::move(*result);
    }

    // reports the held value as not being a valid 'expected'
    void typeMismatch(std::string_view expected) {
        detail::addError(_ctx, DecodeErrorKind::TYPE_MISMATCH, _path, std::string{ expected }, rawValue().value_or(""));
    }
};

namespace detail {

template<Scalar T>
std::optional<T> decodeDocumentScalar(const document::Value &value, const DecodePath &path, DecodeContext &ctx) {
    if constexpr (std::is_same_v<T, bool>) {
        if (const auto *flag = value.asBool()) {
            return *flag;
        }
    } else if constexpr (Number<T>) {
        if (const auto *number = value.asNumber()) {
            if (auto result = ScalarCoercer<T>::coerce(number->text, ctx.config)) {
                return result;
            }
        }
    } else if constexpr (StringLike<T>) {
        if (const auto *string = value.asString()) {
            return T{ *string };
        }
    } else if constexpr (TimePoint<T>) {
        if (const auto *string = value.asString()) {
            if (auto result = ScalarCoercer<T>::coerce(*string, ctx.config)) {
                return result;
            }
            addError(ctx, DecodeErrorKind::MALFORMED_DATE, path, fmt::format("date formatted as '{}'", ctx.config.dateFormat.pattern()), *string);
            return std::nullopt;
        }
    }
    addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, typeName<T>(), describe(Node{ &value }));
    return std::nullopt;
}

// scalars never consult the document bridge: '[1]' is not a valid int32_t
template<Scalar T>
std::optional<T> decodeScalar(const Node &node, const DecodePath &path, DecodeContext &ctx) {
    if (const auto *value = std::get_if<const document::Value *>(&node)) {
        return decodeDocumentScalar<T>(**value, path, ctx);
    }
    const auto *raw = std::get_if<RawValues>(&node);
    if (raw == nullptr) {
        addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, typeName<T>());
        return std::nullopt;
    }
    const std::string *value = selectRaw(*raw, path, ctx, typeName<T>());
    if (value == nullptr) {
        return std::nullopt;
    }
    if (auto result = ScalarCoercer<T>::coerce(*value, ctx.config)) {
        return result;
    }
    if constexpr (TimePoint<T>) {
        addError(ctx, DecodeErrorKind::MALFORMED_DATE, path, fmt::format("date formatted as '{}'", ctx.config.dateFormat.pattern()), *value);
    } else {
        addError(ctx, DecodeErrorKind::TYPE_MISMATCH, path, typeName<T>(), *value);
    }
    return std::nullopt;
}

/**
 * all-or-nothing: the array fails as a whole with MALFORMED_ARRAY (carrying the element failures as causes)
 * if any one of its elements fails
 */
template<ArrayOrVector T>
std::optional<T> decodeArray(const Node &node, const DecodePath &path, DecodeContext &ctx) {
    using ElementType = typename T::value_type;
    Elements elements;
    if (!collectElements(node, path, ctx, typeName<T>(), elements)) {
        return std::nullopt;
    }
    if constexpr (is_array<T>) {
        if (elements.nodes.size() != std::tuple_size_v<T>) {
            addError(ctx, DecodeErrorKind::MALFORMED_ARRAY, path, fmt::format("exactly {} elements but got {}", std::tuple_size_v<T>, elements.nodes.size()), elements.raw);
            return std::nullopt;
        }
    }

    ErrorReport   elementErrors;
    DecodeContext elementContext{ ctx.config, elementErrors };
    T             result{};
    if constexpr (is_vector<T>) {
        result.reserve(elements.nodes.size());
    }
    for (std::size_t i = 0; i < elements.nodes.size(); ++i) {
        auto element = decodeValue<ElementType>(elements.nodes[i], path.element(i), elementContext);
        if (!element) {
            continue;
        }
        if constexpr (is_vector<T>) {
            result.push_back(std::move(*element));
        } else {
            result[i] = std::move(*element);
        }
    }
    if (!elementErrors.empty()) {
        ctx.report.add(DecodeError{ DecodeErrorKind::MALFORMED_ARRAY, path, typeName<T>(), elements.raw, std::move(elementErrors.errors()) });
        return std::nullopt;
    }
    return result;
}

template<ReflectableClass T>
std::optional<T> decodeReflectable(const Node &node, const DecodePath &path, DecodeContext &ctx) {
    Scope scope;
    if (!resolveKeyed(node, path, ctx, typeName<T>(), scope)) {
        return std::nullopt;
    }
    KeyedContainer container(scope.source, path, ctx);
    T              value{};
    std::size_t    failedFields = 0;
    for_each(refl::reflect<T>().members, [&](const auto member, [[maybe_unused]] const auto index) {
        if constexpr (is_field(member) && !is_static(member) && is_writable(member)) {
            if (!container.decode(std::string_view{ member.name.c_str() }, member(value))) {
                ++failedFields;
            }
        }
    });
    if (failedFields > 0) {
        return std::nullopt;
    }
    return value;
}

template<AnnotatedType T>
std::optional<T> decodeAnnotated(const Node &node, const DecodePath &path, DecodeContext &ctx) {
    const auto errorsBefore = ctx.report.size();
    auto       value        = decodeValue<typename T::rep>(node, path, ctx);
    if (!value) {
        const std::string_view unit{ T::unitStr.c_str() };
        auto                  &errors = ctx.report.errors();
        for (std::size_t i = errorsBefore; i < errors.size() && !unit.empty(); ++i) {
            if (errors[i].kind == DecodeErrorKind::TYPE_MISMATCH && errors[i].path == path) {
                errors[i].expected += fmt::format(" [{}]", unit);
            }
        }
        return std::nullopt;
    }
    return std::optional<T>{ std::in_place, std::move(*value) };
}

template<CustomDecodable T>
std::optional<T> decodeCustom(const Node &node, const DecodePath &path, DecodeContext &ctx) {
    const auto errorsBefore = ctx.report.size();
    const auto decoded      = [&](T &&value) -> std::optional<T> {
        if (ctx.report.size() != errorsBefore) {
            return std::nullopt;
        }
        return std::optional<T>{ std::move(value) };
    };
    if constexpr (KeyedDecodable<T>) {
        Scope scope;
        if (!resolveKeyed(node, path, ctx, typeName<T>(), scope)) {
            return std::nullopt;
        }
        KeyedContainer container(scope.source, path, ctx);
        return decoded(QueryDecodable<T>::decode(container));
    } else if constexpr (UnkeyedDecodable<T>) {
        Elements elements;
        if (!collectElements(node, path, ctx, typeName<T>(), elements)) {
            return std::nullopt;
        }
        UnkeyedContainer container(elements.nodes, path, ctx);
        return decoded(QueryDecodable<T>::decode(container));
    } else {
        if (const auto *raw = std::get_if<RawValues>(&node); raw != nullptr && raw->values.size() > 1 && ctx.config.duplicateKeys == DuplicateKeyPolicy::REJECT) {
            selectRaw(*raw, path, ctx, typeName<T>());
            return std::nullopt;
        }
        SingleValueContainer container(node, path, ctx);
        return decoded(QueryDecodable<T>::decode(container));
    }
}

template<typename T>
std::optional<T> decodeValue(const Node &node, const DecodePath &path, DecodeContext &ctx) {
    if constexpr (CustomDecodable<T>) {
        return decodeCustom<T>(node, path, ctx);
    } else if constexpr (AnnotatedType<T>) {
        return decodeAnnotated<T>(node, path, ctx);
    } else if constexpr (OptionalType<T>) {
        if (isNullNode(node)) {
            return std::optional<T>{ std::in_place };
        }
        auto value = decodeValue<typename T::value_type>(node, path, ctx);
        if (!value) {
            return std::nullopt;
        }
        return std::optional<T>{ std::in_place, std::move(*value) };
    } else if constexpr (SmartPointerType<T>) {
        using ElementType = typename T::element_type;
        if (isNullNode(node)) {
            return std::optional<T>{ std::in_place };
        }
        auto value = decodeValue<ElementType>(node, path, ctx);
        if (!value) {
            return std::nullopt;
        }
        if constexpr (std::is_same_v<T, std::shared_ptr<ElementType>>) {
            return std::optional<T>{ std::make_shared<ElementType>(std::move(*value)) };
        } else {
            return std::optional<T>{ std::make_unique<ElementType>(std::move(*value)) };
        }
    } else if constexpr (Scalar<T>) {
        return decodeScalar<T>(node, path, ctx);
    } else if constexpr (ArrayOrVector<T>) {
        return decodeArray<T>(node, path, ctx);
    } else if constexpr (ReflectableClass<T>) {
        return decodeReflectable<T>(node, path, ctx);
    } else {
        static_assert(always_false<T>, "don't know how to decode this type: declare it with QPARAM_REFLECT or specialise qparam::QueryDecodable");
        return std::nullopt;
    }
}

} // namespace detail

/**
 * decodes T from an already built parameter map, collecting as many field failures as possible
 */
template<typename T>
DecodeOutcome<T> decodeTopLevel(const ParameterMap &parameters, const DecodeConfig &config = defaultConfig()) {
    ErrorReport           report;
    detail::DecodeContext ctx{ config, report };
    auto                  value = detail::decodeValue<T>(detail::Node{ &parameters }, DecodePath{}, ctx);
    if (!value || !report.empty()) {
        if (config.logErrors) {
            debug::log() << fmt::format("failed to decode {} from {}: {}", typeName<T>(), parameters, report);
        }
        return std::unexpected(std::move(report));
    }
    return std::move(*value);
}

/**
 * tokenises the raw query string (the part after '?') and decodes T from it
 */
template<typename T>
DecodeOutcome<T> decode(std::string_view rawQuery, const DecodeConfig &config = defaultConfig()) {
    return decodeTopLevel<T>(ParameterMap::parse(rawQuery, config.formEncoding), config);
}

// throwing flavour of decode(..), the DecodeException carries the full ErrorReport
template<typename T>
T decodeOrThrow(std::string_view rawQuery, const DecodeConfig &config = defaultConfig()) {
    auto outcome = decode<T>(rawQuery, config);
    if (!outcome) {
        throw DecodeException(std::move(outcome.error()));
    }
    return std::move(*outcome);
}

} // namespace qparam

#endif // QPARAM_QUERYDECODER_HPP
