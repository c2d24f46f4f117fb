#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <type_traits>

#include "enum_map.hpp"
#include "key_name.hpp"
#include "key_schema.hpp"

namespace EnumFusion {

/// Which JSON shape a mapped value takes. Checked in this order, so a
/// std::optional<bool> is nullable JSON and not a key string.
namespace value_model {

enum class ValueKind {
    unsupported,
    boolean,
    number,
    string,
    nullable,
    object,
    key_string
};

namespace detail {

template<class T>
struct always_false : std::false_type {};

template<class T>
constexpr bool is_char_type_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template<class T>
consteval ValueKind classify();

template<class T>
struct enum_map_value_ok : std::false_type {};

template<class K, class V>
struct enum_map_value_ok<EnumMap<K, V>>
    : std::bool_constant<KeyTextual<K> && classify<V>() != ValueKind::unsupported && std::default_initializable<V>> {};

template<class T>
consteval ValueKind classify() {
    using key_schema::input_checks::is_specialization_of_v;
    if constexpr (key_schema::input_checks::is_directly_forbidden_v<T>) {
        return ValueKind::unsupported;
    } else if constexpr (std::is_same_v<T, bool>) {
        return ValueKind::boolean;
    } else if constexpr (std::is_integral_v<T> && !is_char_type_v<T>) {
        return ValueKind::number;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return ValueKind::string;
    } else if constexpr (is_specialization_of_v<T, std::optional>) {
        using Inner = typename T::value_type;
        if constexpr (is_specialization_of_v<Inner, std::optional> || classify<Inner>() == ValueKind::unsupported) {
            return ValueKind::unsupported;
        } else {
            return ValueKind::nullable;
        }
    } else if constexpr (is_enum_map_v<T>) {
        return enum_map_value_ok<T>::value ? ValueKind::object : ValueKind::unsupported;
    } else if constexpr (KeyTextual<T>) {
        return ValueKind::key_string;
    } else {
        return ValueKind::unsupported;
    }
}

} // namespace detail

template<class T>
inline constexpr ValueKind value_kind_v = detail::classify<T>();

} // namespace value_model


template<class V>
concept JsonValue = value_model::value_kind_v<V> != value_model::ValueKind::unsupported &&
                    std::default_initializable<V>;

template<class M>
concept JsonEnumMap = is_enum_map_v<M> && JsonValue<std::remove_cvref_t<M>>;

} // namespace EnumFusion
