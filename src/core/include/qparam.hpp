#ifndef QPARAM_HPP
#define QPARAM_HPP

#include <array>
#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <refl.hpp>
#include <units/concepts.h>
#include <units/quantity.h>

// makes the listed public fields visible to the compile-time reflection used by the query decoder and encoder
#define QPARAM_REFLECT(TypeName, ...) \
    REFL_TYPE(TypeName __VA_OPT__(, )) \
    REFL_DETAIL_FOR_EACH(REFL_DETAIL_EX_1_field __VA_OPT__(, ) __VA_ARGS__) \
    REFL_END

namespace units::detail { // TODO: temporary -> remove with next mp-units release
template<typename T>
requires units::is_derived_from_specialization_of<T, units::quantity> && requires {
    typename T::dimension;
    typename T::unit;
    typename T::rep;
}
inline constexpr const bool is_quantity<T> = true;
} // namespace units::detail

namespace qparam {
template<typename>
constexpr bool always_false = false;

using units::basic_fixed_string;

template<typename T, typename Type = std::remove_cvref_t<T>>
inline constexpr const bool isStdType = get_name(refl::reflect<Type>()).template substr<0, 5>() == "std::";

template<class T, typename RawType = std::remove_cvref_t<T>>
inline constexpr bool isReflectableClass() {
    if constexpr (std::is_class_v<RawType> && refl::is_reflectable<RawType>() && !std::is_fundamental_v<RawType> && !std::is_array_v<RawType>) {
        return !isStdType<RawType>;
    }
    return false;
}
template<class T>
concept ReflectableClass = isReflectableClass<T>();

template<typename T, typename RawType = std::remove_cvref_t<T>>
inline constexpr bool is_char = std::is_same_v<RawType, char> || std::is_same_v<RawType, wchar_t> || std::is_same_v<RawType, char8_t> || std::is_same_v<RawType, char16_t> || std::is_same_v<RawType, char32_t>;

// integers of any width and signedness (int8_t/uint8_t included), but neither bool nor character types
template<typename T, typename RawType = std::remove_cvref_t<T>>
concept Integer = std::integral<RawType> && !std::is_same_v<RawType, bool> && !is_char<RawType>;

template<typename T, typename RawType = std::remove_cvref_t<T>>
concept FloatingPoint = std::is_same_v<RawType, float> || std::is_same_v<RawType, double>;

template<typename T>
concept Number = Integer<T> || FloatingPoint<T>;

template<typename T, typename RawType = std::remove_cvref_t<T>>
inline constexpr bool is_stringlike = units::is_derived_from_specialization_of<RawType, std::basic_string>;

template<typename T>
concept StringLike = is_stringlike<T>;

template<typename T>
inline constexpr const bool is_time_point = false;
template<typename Duration>
inline constexpr const bool is_time_point<std::chrono::time_point<std::chrono::system_clock, Duration>> = true;

template<typename T>
concept TimePoint = is_time_point<std::remove_cvref_t<T>>;

template<typename T>
inline constexpr const bool is_array = false;
template<typename T, std::size_t N>
inline constexpr const bool is_array<std::array<T, N>> = true;

template<typename T, typename Tp = std::remove_const_t<T>>
inline constexpr bool is_vector = units::is_derived_from_specialization_of<Tp, std::vector>;

template<typename T>
concept ArrayOrVector = is_vector<T> || is_array<std::remove_const_t<T>>;

template<typename T>
inline constexpr const bool is_optional = false;
template<typename T>
inline constexpr const bool is_optional<std::optional<T>> = true;

template<typename T>
concept OptionalType = is_optional<std::remove_cvref_t<T>>;

template<typename T>
inline constexpr const bool is_smart_pointer = false;
template<typename T, typename Deleter>
inline constexpr const bool is_smart_pointer<std::unique_ptr<T, Deleter>> = true;
template<typename T>
inline constexpr const bool is_smart_pointer<std::shared_ptr<T>> = true;

template<class T>
concept SmartPointerType = is_smart_pointer<std::remove_cvref_t<T>>;

/*
 * unit-/description-type annotation
 */
template<typename T>
concept NotRepresentation = units::Quantity<T> || units::QuantityLike<T> || units::wrapped_quantity_<T> || (!std::regular<T>) || (!units::scalable_<T>) || std::is_class_v<T>;

using NoUnit = units::dimensionless<units::one>;

template<typename Rep, units::Quantity Q = NoUnit, const basic_fixed_string description = "">
struct Annotated; // N.B. two implementations since most non-numeric classes do not qualify as units::Representation

template<typename T>
inline constexpr const bool is_annotated = false;
template<typename T, units::Quantity Q, const basic_fixed_string description>
inline constexpr const bool is_annotated<Annotated<T, Q, description>> = true;

template<class T>
concept AnnotatedType = is_annotated<std::remove_cvref_t<T>>;
template<class T>
concept NotAnnotatedType = !is_annotated<std::remove_cvref_t<T>>;

template<units::Representation Rep, units::Quantity Q, const basic_fixed_string description>
struct Annotated<Rep, Q, description> : public units::quantity<typename Q::dimension, typename Q::unit, Rep> {
    using dimension                            = typename Q::dimension;
    using unit                                 = typename Q::unit;
    using rep                                  = Rep;
    using R                                    = units::quantity<dimension, unit, rep>;
    static constexpr basic_fixed_string unitStr = units::detail::unit_text<dimension, unit>().ascii();

    constexpr Annotated()
        : R() {}
    constexpr explicit(!std::is_trivial_v<Rep>) Annotated(const rep &initValue) noexcept
        : R(initValue) {}
    constexpr explicit(!std::is_trivial_v<Rep>) Annotated(const R &t)
        : R(t) {}

    [[nodiscard]] constexpr std::string_view getUnit() const noexcept { return unitStr.c_str(); }
    [[nodiscard]] constexpr std::string_view getDescription() const noexcept { return description.c_str(); }

    constexpr auto                           operator<=>(const Annotated &) const noexcept = default;
    [[nodiscard]] inline constexpr rep       &value() & noexcept { return this->number(); }
    [[nodiscard]] inline constexpr const rep &value() const & noexcept { return this->number(); }
};

template<NotRepresentation T, units::Quantity Q, const basic_fixed_string description>
struct Annotated<T, Q, description> : public T { // inherit from T directly to also inherit its operators & member functions
    using dimension                            = typename Q::dimension;
    using unit                                 = typename Q::unit;
    using rep                                  = T;
    static constexpr basic_fixed_string unitStr = units::detail::unit_text<dimension, unit>().ascii();

    constexpr Annotated()
        : T() {}
    constexpr Annotated(const T &t)
        : T(t) {}
    constexpr Annotated(T &&t)
        : T(std::move(t)) {}

    template<class S, std::enable_if_t<std::is_constructible_v<T, std::initializer_list<S>>, int> = 0>
    Annotated(std::initializer_list<S> init)
        : T(init) {}

    [[nodiscard]] constexpr std::string_view getUnit() const noexcept { return unitStr.c_str(); }
    [[nodiscard]] constexpr std::string_view getDescription() const noexcept { return description.c_str(); }

    bool                                     operator==(const Annotated &) const = default;
    [[nodiscard]] inline constexpr T        &value() & noexcept { return *this; }
    [[nodiscard]] inline constexpr const T  &value() const & noexcept { return *this; }
};

template<NotAnnotatedType T>
constexpr T &getAnnotatedMember(T &value) noexcept {
    return value;
}

template<NotAnnotatedType T>
constexpr const T &getAnnotatedMember(const T &value) noexcept {
    return value;
}

template<AnnotatedType T>
constexpr typename T::rep &getAnnotatedMember(T &annotatedValue) noexcept {
    return annotatedValue.value();
}

template<AnnotatedType T>
constexpr const typename T::rep &getAnnotatedMember(const T &annotatedValue) noexcept {
    return annotatedValue.value();
}

/* human-readable type names used in error reports */
template<typename T>
std::string typeName() {
    using Type = std::remove_cvref_t<T>;
    if constexpr (AnnotatedType<Type>) { // N.B. checked first since Annotated<T> may derive from T
        return fmt::format("Annotated<{}>", typeName<typename Type::rep>());
    } else if constexpr (std::is_same_v<Type, bool>) {
        return "bool";
    } else if constexpr (Integer<Type>) {
        return fmt::format("{}int{}_t", std::is_unsigned_v<Type> ? "u" : "", 8 * sizeof(Type));
    } else if constexpr (std::is_same_v<Type, float>) {
        return "float";
    } else if constexpr (std::is_same_v<Type, double>) {
        return "double";
    } else if constexpr (StringLike<Type>) {
        return "string";
    } else if constexpr (TimePoint<Type>) {
        return "timestamp";
    } else if constexpr (is_optional<Type>) {
        return fmt::format("optional<{}>", typeName<typename Type::value_type>());
    } else if constexpr (is_smart_pointer<Type>) {
        return typeName<typename Type::element_type>();
    } else if constexpr (is_vector<Type>) {
        return fmt::format("vector<{}>", typeName<typename Type::value_type>());
    } else if constexpr (is_array<Type>) {
        return fmt::format("array<{},{}>", typeName<typename Type::value_type>(), std::tuple_size_v<Type>);
    } else if constexpr (ReflectableClass<Type>) {
        return std::string{ refl::reflect<Type>().name.c_str() };
    } else {
        return typeid(Type).name(); // safe fall-back
    }
}

} // namespace qparam

#endif // QPARAM_HPP
