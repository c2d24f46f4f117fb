#pragma once

#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>
#include <pfr/tuple_size.hpp>
#include <pfr/core.hpp>
#include <pfr/traits.hpp>

#include "key_meta.hpp"

namespace EnumFusion {

namespace introspection {

namespace detail {

// Plain aggregates: fields come from PFR in declaration order.
template<class T>
struct IntrospectionImpl {
    using StructT = std::remove_cv_t<T>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        return (pfr::get<Index>(s));
    }

    static constexpr std::size_t structureElementsCount = pfr::tuple_size_v<StructT>;

    template<std::size_t Index>
    using structureElementTypeByIndex = pfr::tuple_element_t<Index, StructT>;

    template<class ... Elements>
    static constexpr StructT makeStruct(Elements && ... elements) {
        return StructT{std::forward<Elements>(elements)...};
    }
};

// Structs described by KeyMeta<T>::Fields: fields come from member pointers
// in the listed order. Construction needs a default constructible struct.
template <class T>
    requires (HasKeyFields<T>)
struct IntrospectionImpl<T> {
    using StructT = std::remove_cv_t<T>;
    using Fields = typename KeyMeta<T>::Fields::FieldsTuple;
    static constexpr std::size_t structureElementsCount = std::tuple_size_v<Fields>;

    template<std::size_t Index>
    static constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
        using Field = std::tuple_element_t<Index, Fields>;
        return (s.*(Field::MemberP));
    }

    template<std::size_t Index>
    using structureElementTypeByIndex = typename std::tuple_element_t<Index, Fields>::ValueT;

    template<class ... Elements>
    static constexpr StructT makeStruct(Elements && ... elements) {
        static_assert(std::is_default_constructible_v<StructT>,
                      "[[[ EnumFusion ]]] structs described by KeyMeta<T>::Fields must be default constructible");
        StructT s{};
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            ((s.*(std::tuple_element_t<I, Fields>::MemberP) = std::forward<Elements>(elements)), ...);
        }(std::index_sequence_for<Elements...>{});
        return s;
    }
};

} // namespace detail


template<class StructT>
concept Reflectable = HasKeyFields<std::remove_cv_t<StructT>> ||
                      (std::is_class_v<StructT> && std::is_aggregate_v<StructT> &&
                       !std::is_union_v<StructT> && pfr::is_implicitly_reflectable_v<StructT, StructT>);

template<std::size_t Index, class StructT>
constexpr decltype(auto) getStructElementByIndex(const StructT & s) {
    using Impl = detail::IntrospectionImpl<std::remove_cv_t<StructT>>;
    return (Impl::template getStructElementByIndex<Index>(s));
}

template<class StructT>
inline constexpr std::size_t structureElementsCount = detail::IntrospectionImpl<std::remove_cv_t<StructT>>::structureElementsCount;

template<std::size_t Index, class StructT>
using structureElementTypeByIndex = typename detail::IntrospectionImpl<std::remove_cv_t<StructT>>::template structureElementTypeByIndex<Index>;

template<class StructT, class ... Elements>
constexpr StructT makeStructFromElements(Elements && ... elements) {
    static_assert(sizeof...(Elements) == structureElementsCount<StructT>,
                  "[[[ EnumFusion ]]] element count does not match the struct");
    return detail::IntrospectionImpl<std::remove_cv_t<StructT>>::makeStruct(std::forward<Elements>(elements)...);
}

}
}
