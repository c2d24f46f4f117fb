#pragma once
#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "key_meta.hpp"
#include "key_schema.hpp"
#include "detail/contract.hpp"

#ifndef ENUMFUSION_DENSE_ENUM_TABLE_LIMIT
#define ENUMFUSION_DENSE_ENUM_TABLE_LIMIT 256
#endif

namespace EnumFusion {

/// Bijection between the values of K and [0, cardinality).
///
/// Specializations provide
///   static constexpr std::size_t cardinality;
///   static constexpr std::size_t encode(const K &);
///   static constexpr K decode(std::size_t);   // index < cardinality
///
/// The library derives it for every shape classified by key_schema::classify;
/// users may fully specialize it for their own types.
template<class K>
struct key_traits {};

template<class K>
concept EnumKey = requires(const K & k, std::size_t i) {
    { key_traits<K>::cardinality } -> std::convertible_to<std::size_t>;
    { key_traits<K>::encode(k) } -> std::same_as<std::size_t>;
    { key_traits<K>::decode(i) } -> std::same_as<K>;
};

template<EnumKey K>
inline constexpr std::size_t cardinality_v = key_traits<K>::cardinality;

template<EnumKey K>
constexpr std::size_t encode(const K & key) {
    return key_traits<K>::encode(key);
}

template<EnumKey K>
constexpr K decode(std::size_t index) {
    return key_traits<K>::decode(index);
}


namespace key_traits_detail {

constexpr bool mul_overflows(std::size_t a, std::size_t b) {
    return b != 0 && a > std::numeric_limits<std::size_t>::max() / b;
}

constexpr bool add_overflows(std::size_t a, std::size_t b) {
    return a > std::numeric_limits<std::size_t>::max() - b;
}

/// Mixed-radix little-endian layout of a product: the first field varies
/// fastest, field i has weight c_0 * ... * c_{i-1}.
template<class ... Fields>
struct mixed_radix {
    static constexpr std::size_t count = sizeof...(Fields);
    static constexpr std::array<std::size_t, count> radices{key_traits<Fields>::cardinality...};

    static constexpr bool has_empty_field = [] {
        for(std::size_t r : radices) {
            if(r == 0) return true;
        }
        return false;
    }();

    // A product with an empty field has no values, whatever the other radices are.
    static constexpr bool overflows = [] {
        if(has_empty_field) return false;
        std::size_t acc = 1;
        for(std::size_t r : radices) {
            if(mul_overflows(acc, r)) return true;
            acc *= r;
        }
        return false;
    }();

    static constexpr std::size_t size = [] {
        if(has_empty_field || overflows) return std::size_t{0};
        std::size_t acc = 1;
        for(std::size_t r : radices) {
            acc *= r;
        }
        return acc;
    }();

    static constexpr std::array<std::size_t, count> weights = [] {
        std::array<std::size_t, count> w{};
        if(has_empty_field || overflows) return w;
        std::size_t acc = 1;
        for(std::size_t i = 0; i < count; i ++) {
            w[i] = acc;
            acc *= radices[i];
        }
        return w;
    }();

    template<std::size_t I>
    static constexpr std::size_t digit(std::size_t local_index) {
        return local_index / weights[I] % radices[I];
    }
};

/// Variants of a sum occupy consecutive sub-ranges in declaration order:
/// alternative i owns [bases[i], bases[i + 1]).
template<class ... Alternatives>
struct sum_layout {
    static constexpr std::size_t count = sizeof...(Alternatives);
    static constexpr std::array<std::size_t, count> sizes{key_traits<Alternatives>::cardinality...};

    static constexpr bool overflows = [] {
        std::size_t acc = 0;
        for(std::size_t s : sizes) {
            if(add_overflows(acc, s)) return true;
            acc += s;
        }
        return false;
    }();

    static constexpr std::array<std::size_t, count + 1> bases = [] {
        std::array<std::size_t, count + 1> b{};
        if(overflows) return b;
        for(std::size_t i = 0; i < count; i ++) {
            b[i + 1] = b[i] + sizes[i];
        }
        return b;
    }();

    static constexpr std::size_t size = bases[count];

    // First alternative whose range ends past the index; empty alternatives
    // have bases[i] == bases[i + 1] and are skipped naturally.
    static constexpr std::size_t alternative_of(std::size_t index) {
        auto it = std::upper_bound(bases.begin() + 1, bases.end(), index);
        return static_cast<std::size_t>(it - (bases.begin() + 1));
    }
};

template<class T, class Seq = std::make_index_sequence<key_schema::product_access<T>::count>>
struct product_layout;

template<class T, std::size_t ... I>
struct product_layout<T, std::index_sequence<I...>> {
    using Access = key_schema::product_access<T>;
    static constexpr bool fields_are_keys = (EnumKey<typename Access::template element_type<I>> && ...);
};

template<class T, class Seq = std::make_index_sequence<key_schema::product_access<T>::count>>
struct product_radix_of;

template<class T, std::size_t ... I>
struct product_radix_of<T, std::index_sequence<I...>> {
    using type = mixed_radix<typename key_schema::product_access<T>::template element_type<I>...>;
};

template<class T>
using product_radix = typename product_radix_of<T>::type;

template<class T>
concept ProductOfKeys = key_schema::ProductKey<T> && product_layout<T>::fields_are_keys;

template<class T>
struct variant_alternatives_are_keys : std::false_type {};

template<class ... Alts>
struct variant_alternatives_are_keys<std::variant<Alts...>>
    : std::bool_constant<(EnumKey<Alts> && ...)> {};

template<class E>
using enum_offset_t = std::make_unsigned_t<std::conditional_t<std::is_same_v<std::underlying_type_t<E>, bool>,
                                                              unsigned char, std::underlying_type_t<E>>>;

template<class E>
constexpr bool enum_less(E a, E b) {
    using U = std::underlying_type_t<E>;
    return static_cast<U>(a) < static_cast<U>(b);
}

// to - from in the underlying type, computed modulo 2^n so it never
// overflows; requires from <= to.
template<class E>
constexpr std::size_t enum_distance(E from, E to) {
    using U = std::underlying_type_t<E>;
    using O = enum_offset_t<E>;
    return static_cast<std::size_t>(static_cast<O>(static_cast<O>(static_cast<U>(to)) - static_cast<O>(static_cast<U>(from))));
}

template<class E, class Pack>
struct enum_table;

template<class E, class ... V>
struct enum_table<E, KeyVariants<V...>> {
    static constexpr std::size_t count = sizeof...(V);
    static constexpr std::array<E, count> values{V::value...};
    static constexpr std::array<std::string_view, count> names{V::Name.toStringView()...};

    static constexpr bool all_distinct = [] {
        for(std::size_t i = 0; i < count; i ++) {
            for(std::size_t j = i + 1; j < count; j ++) {
                if(values[i] == values[j]) return false;
                if(names[i] == names[j]) return false;
            }
        }
        return true;
    }();

    static constexpr E min_value = [] {
        if constexpr (count == 0) {
            return E{};
        } else {
            E m = values[0];
            for(E v : values) {
                if(enum_less(v, m)) m = v;
            }
            return m;
        }
    }();

    static constexpr std::size_t max_offset = [] {
        std::size_t m = 0;
        for(E v : values) {
            if(enum_distance(min_value, v) > m) m = enum_distance(min_value, v);
        }
        return m;
    }();

    // Compact enumerator ranges get an O(1) value -> index table; sparse
    // ones fall back to a scan of the variant list.
    static constexpr bool dense = count > 0 && max_offset < ENUMFUSION_DENSE_ENUM_TABLE_LIMIT;

    static constexpr std::array<std::size_t, dense ? max_offset + 1 : 0> dense_table = [] {
        std::array<std::size_t, dense ? max_offset + 1 : 0> t{};
        for(auto & e : t) e = std::numeric_limits<std::size_t>::max();
        if constexpr (dense) {
            for(std::size_t i = 0; i < count; i ++) {
                t[enum_distance(min_value, values[i])] = i;
            }
        }
        return t;
    }();
};

} // namespace key_traits_detail


template<class K>
    requires (key_schema::key_kind_v<K> == key_schema::KeyKind::boolean)
struct key_traits<K> {
    static constexpr std::size_t cardinality = 2;

    static constexpr std::size_t encode(const K & key) {
        return key ? 1 : 0;
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<bool>::decode", index, cardinality);
        }
        return index == 1;
    }
};


template<class K>
    requires (key_schema::key_kind_v<K> == key_schema::KeyKind::byte)
struct key_traits<K> {
    static constexpr std::size_t cardinality = std::size_t{1} << std::numeric_limits<unsigned char>::digits;
    static constexpr int lowest = std::numeric_limits<K>::lowest();

    static constexpr std::size_t encode(const K & key) {
        return static_cast<std::size_t>(static_cast<int>(key) - lowest);
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<byte>::decode", index, cardinality);
        }
        return static_cast<K>(static_cast<int>(index) + lowest);
    }
};


template<class K>
    requires (key_schema::key_kind_v<K> == key_schema::KeyKind::unit)
struct key_traits<K> {
    static constexpr std::size_t cardinality = 1;

    static constexpr std::size_t encode(const K &) {
        return 0;
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<unit>::decode", index, cardinality);
        }
        return K{};
    }
};


template<class K>
    requires (key_schema::key_kind_v<K> == key_schema::KeyKind::unit_enum)
struct key_traits<K> {
private:
    using Table = key_traits_detail::enum_table<K, typename KeyMeta<K>::Variants>;
    static_assert(Table::all_distinct, "[[[ EnumFusion ]]] KeyMeta<E>::Variants lists an enumerator or a name twice");

    static constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

    static constexpr std::size_t lookup(K key) {
        if constexpr (Table::dense) {
            if(key_traits_detail::enum_less(key, Table::min_value)) return npos;
            const std::size_t off = key_traits_detail::enum_distance(Table::min_value, key);
            if(off >= Table::dense_table.size()) return npos;
            return Table::dense_table[off];
        } else {
            for(std::size_t i = 0; i < Table::count; i ++) {
                if(Table::values[i] == key) return i;
            }
            return npos;
        }
    }

public:
    static constexpr std::size_t cardinality = Table::count;

    static constexpr std::size_t encode(const K & key) {
        const std::size_t index = lookup(key);
        if(index == npos) {
            detail::contract_violation("enumerator is not listed in KeyMeta<E>::Variants");
        }
        return index;
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<enum>::decode", index, cardinality);
        }
        return Table::values[index];
    }
    static constexpr std::string_view name(std::size_t index) {
        return Table::names[index];
    }
};


template<class K>
    requires (key_schema::key_kind_v<K> == key_schema::KeyKind::optional &&
              EnumKey<typename K::value_type>)
struct key_traits<K> {
    using Inner = typename K::value_type;
    static_assert(key_traits<Inner>::cardinality < std::numeric_limits<std::size_t>::max(),
                  "[[[ EnumFusion ]]] key cardinality does not fit std::size_t");

    static constexpr std::size_t cardinality = 1 + key_traits<Inner>::cardinality;

    static constexpr std::size_t encode(const K & key) {
        if(!key.has_value()) return 0;
        return 1 + key_traits<Inner>::encode(*key);
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<optional>::decode", index, cardinality);
        }
        if(index == 0) return K{std::nullopt};
        return K{std::in_place, key_traits<Inner>::decode(index - 1)};
    }
};


template<class K>
    requires (key_schema::key_kind_v<K> == key_schema::KeyKind::sum &&
              key_traits_detail::variant_alternatives_are_keys<K>::value)
struct key_traits<K> {
private:
    template<class V>
    struct layout_of;
    template<class ... Alts>
    struct layout_of<std::variant<Alts...>> {
        using type = key_traits_detail::sum_layout<Alts...>;
    };
    using Layout = typename layout_of<K>::type;
    static_assert(!Layout::overflows, "[[[ EnumFusion ]]] key cardinality does not fit std::size_t");

    static constexpr std::size_t alternatives = Layout::count;

    template<std::size_t I>
    using Alternative = std::variant_alternative_t<I, K>;

    template<std::size_t I>
    static constexpr std::size_t encode_alternative(const K & key) {
        return Layout::bases[I] + key_traits<Alternative<I>>::encode(*std::get_if<I>(&key));
    }

    template<std::size_t I>
    static constexpr K decode_alternative(std::size_t index) {
        return K{std::in_place_index<I>, key_traits<Alternative<I>>::decode(index - Layout::bases[I])};
    }

    using Encoder = std::size_t (*)(const K &);
    using Decoder = K (*)(std::size_t);

    static constexpr std::array<Encoder, alternatives> encoders = []<std::size_t ... I>(std::index_sequence<I...>) {
        return std::array<Encoder, alternatives>{&encode_alternative<I>...};
    }(std::make_index_sequence<alternatives>{});

    static constexpr std::array<Decoder, alternatives> decoders = []<std::size_t ... I>(std::index_sequence<I...>) {
        return std::array<Decoder, alternatives>{&decode_alternative<I>...};
    }(std::make_index_sequence<alternatives>{});

public:
    static constexpr std::size_t cardinality = Layout::size;

    static constexpr std::size_t base_of(std::size_t alternative) {
        return Layout::bases[alternative];
    }

    static constexpr std::size_t encode(const K & key) {
        if(key.valueless_by_exception()) {
            detail::contract_violation("valueless std::variant used as a key");
        }
        return encoders[key.index()](key);
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<variant>::decode", index, cardinality);
        }
        return decoders[Layout::alternative_of(index)](index);
    }
};


template<class K>
    requires (key_traits_detail::ProductOfKeys<K>)
struct key_traits<K> {
private:
    using Access = key_schema::product_access<K>;
    using Radix = key_traits_detail::product_radix<K>;
    static_assert(!Radix::overflows, "[[[ EnumFusion ]]] key cardinality does not fit std::size_t");

    template<std::size_t I>
    using FieldT = typename Access::template element_type<I>;

    static constexpr auto fields = std::make_index_sequence<Access::count>{};

public:
    static constexpr std::size_t cardinality = Radix::size;

    static constexpr std::size_t radix(std::size_t field) {
        return Radix::radices[field];
    }
    static constexpr std::size_t weight(std::size_t field) {
        return Radix::weights[field];
    }

    static constexpr std::size_t encode(const K & key) {
        return [&]<std::size_t ... I>(std::index_sequence<I...>) {
            return (std::size_t{0} + ... + (Radix::weights[I] * key_traits<FieldT<I>>::encode(Access::template get<I>(key))));
        }(fields);
    }
    static constexpr K decode(std::size_t index) {
        if(index >= cardinality) {
            detail::index_out_of_range("key_traits<product>::decode", index, cardinality);
        }
        return [&]<std::size_t ... I>(std::index_sequence<I...>) {
            return Access::make(key_traits<FieldT<I>>::decode(Radix::template digit<I>(index))...);
        }(fields);
    }
};

} // namespace EnumFusion
