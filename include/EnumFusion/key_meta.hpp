#pragma once

#include <cstddef>
#include <string_view>
#include <tuple>
#include <type_traits>

#include "const_string.hpp"

namespace EnumFusion {

/// Customization point describing a key type.
///
/// Specialize it for:
///  - enumerations: provide `using Variants = KeyVariants<Variant<E::A, "A">, ...>;`
///    The order of the list is the index order; enumerator values play no part.
///  - structs that should not be reflected by PFR: provide
///    `using Fields = KeyFields<Field<&S::a>, Field<&S::b>>;`
///  - any type used as a std::variant alternative: optionally provide
///    `static constexpr ConstString name = "Label";`
template <class T>
struct KeyMeta {

};

template <auto Value, ConstString name>
struct Variant {
    static_assert(std::is_enum_v<decltype(Value)>, "[[[ EnumFusion ]]] Variant<> expects an enumerator");
    static_assert(name.check(), "[[[ EnumFusion ]]] variant name must be non-empty, must not start with a digit or '-' and must not contain '(', ')', ',' or spaces");
    using EnumT = decltype(Value);
    static constexpr EnumT value = Value;
    static constexpr ConstString Name = name;
};

template <class ... V>
struct KeyVariants {
    static constexpr std::size_t count = sizeof...(V);
};


template <auto MPtr>
struct Field;

template <typename C, typename T, T C::*MPtr>
struct Field<MPtr> {
    using ClassT = C;
    using ValueT = T;
    static constexpr T C::* MemberP = MPtr;
};

template <class ... F>
struct KeyFields {
    using FieldsTuple = std::tuple<F...>;
};


namespace meta_detail {

template<class T>
struct is_variants_pack : std::false_type {};

template<class... V>
struct is_variants_pack<KeyVariants<V...>> : std::true_type {};

template<class T>
struct is_fields_pack : std::false_type {};

template<class... F>
struct is_fields_pack<KeyFields<F...>> : std::true_type {};

} // namespace meta_detail


template<class T>
concept HasKeyVariants = std::is_enum_v<T> && requires {
    typename KeyMeta<T>::Variants;
} && meta_detail::is_variants_pack<typename KeyMeta<T>::Variants>::value;

template<class T>
concept HasKeyFields = std::is_class_v<T> && requires {
    typename KeyMeta<T>::Fields;
} && meta_detail::is_fields_pack<typename KeyMeta<T>::Fields>::value;


namespace meta_detail {

template<class T>
concept MetaNamed = requires {
    { KeyMeta<T>::name.toStringView() } -> std::convertible_to<std::string_view>;
};

template<class T>
concept SelfNamed = std::is_class_v<T> && requires {
    { T::name.toStringView() } -> std::convertible_to<std::string_view>;
};

} // namespace meta_detail

template<class T>
concept HasKeyName = meta_detail::MetaNamed<T> || meta_detail::SelfNamed<T>;

/// Label of a type used as a std::variant alternative.
template<HasKeyName T>
constexpr std::string_view key_name_of() {
    if constexpr (meta_detail::MetaNamed<T>) {
        static_assert(KeyMeta<T>::name.check(), "[[[ EnumFusion ]]] KeyMeta<T>::name is not a valid label");
        return KeyMeta<T>::name.toStringView();
    } else {
        static_assert(T::name.check(), "[[[ EnumFusion ]]] T::name is not a valid label");
        return T::name.toStringView();
    }
}

} // namespace EnumFusion
