#pragma once
#include <array>
#include <cstddef>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "key_meta.hpp"
#include "struct_introspection.hpp"

namespace EnumFusion {

namespace key_schema {

namespace input_checks {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cv_t<T>, Template>::value;

template<class T>
struct is_std_array : std::false_type {};

template<class T, std::size_t N>
struct is_std_array<std::array<T, N>> : std::true_type {};

template<class T>
constexpr bool is_std_array_v = is_std_array<std::remove_cv_t<T>>::value;

// Shapes that can never act as keys, whatever the user specializes.
template<class T>
struct is_directly_forbidden {
    static constexpr bool value =
        std::is_void_v<T> ||
        std::is_pointer_v<T> ||
        std::is_member_pointer_v<T> ||
        std::is_null_pointer_v<T> ||
        std::is_function_v<T> ||
        std::is_reference_v<T> ||
        std::is_const_v<T> ||
        std::is_volatile_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v = is_directly_forbidden<T>::value;

} // namespace input_checks


enum class KeyKind {
    not_a_key,
    boolean,         // false, true
    byte,            // 256 values
    unit_enum,       // enum listed through KeyMeta<E>::Variants
    unit,            // std::monostate
    optional,        // None, then Some(T)
    sum,             // std::variant, alternatives in declaration order
    product_tuple,   // std::tuple, std::pair, std::array
    product_struct   // aggregate (PFR) or KeyMeta<T>::Fields
};

template<class T>
consteval KeyKind classify() {
    using namespace input_checks;
    if constexpr (is_directly_forbidden_v<T>) {
        return KeyKind::not_a_key;
    } else if constexpr (std::is_same_v<T, bool>) {
        return KeyKind::boolean;
    } else if constexpr (std::is_same_v<T, unsigned char> || std::is_same_v<T, signed char>) {
        return KeyKind::byte;
    } else if constexpr (HasKeyVariants<T>) {
        return KeyKind::unit_enum;
    } else if constexpr (std::is_same_v<T, std::monostate>) {
        return KeyKind::unit;
    } else if constexpr (is_specialization_of_v<T, std::optional>) {
        return KeyKind::optional;
    } else if constexpr (is_specialization_of_v<T, std::variant>) {
        return KeyKind::sum;
    } else if constexpr (is_specialization_of_v<T, std::tuple> ||
                         is_specialization_of_v<T, std::pair> ||
                         is_std_array_v<T>) {
        return KeyKind::product_tuple;
    } else if constexpr (introspection::Reflectable<T>) {
        return KeyKind::product_struct;
    } else {
        return KeyKind::not_a_key;
    }
}

template<class T>
inline constexpr KeyKind key_kind_v = classify<T>();


/// Uniform field access for product keys.
template<class T, KeyKind = key_kind_v<T>>
struct product_access;

template<class T>
struct product_access<T, KeyKind::product_tuple> {
    static constexpr std::size_t count = std::tuple_size_v<T>;

    template<std::size_t I>
    using element_type = std::remove_cv_t<std::tuple_element_t<I, T>>;

    template<std::size_t I>
    static constexpr decltype(auto) get(const T & t) {
        return (std::get<I>(t));
    }

    template<class ... Elements>
    static constexpr T make(Elements && ... elements) {
        return T{std::forward<Elements>(elements)...};
    }
};

template<class T>
struct product_access<T, KeyKind::product_struct> {
    static constexpr std::size_t count = introspection::structureElementsCount<T>;

    template<std::size_t I>
    using element_type = std::remove_cv_t<introspection::structureElementTypeByIndex<I, T>>;

    template<std::size_t I>
    static constexpr decltype(auto) get(const T & t) {
        return (introspection::getStructElementByIndex<I>(t));
    }

    template<class ... Elements>
    static constexpr T make(Elements && ... elements) {
        return introspection::makeStructFromElements<T>(std::forward<Elements>(elements)...);
    }
};

template<class T>
concept ProductKey = key_kind_v<T> == KeyKind::product_tuple || key_kind_v<T> == KeyKind::product_struct;

// Unit-shaped types carry exactly one value and no data: std::monostate,
// std::tuple<>, empty aggregates.
template<class T>
constexpr bool is_unit_shaped() {
    if constexpr (key_kind_v<T> == KeyKind::unit) {
        return true;
    } else if constexpr (ProductKey<T>) {
        return product_access<T>::count == 0;
    } else {
        return false;
    }
}

} // namespace key_schema

} // namespace EnumFusion
