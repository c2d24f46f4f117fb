#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "enum_map.hpp"
#include "detail/contract.hpp"

namespace EnumFusion {

namespace literal_detail {

template<class K, class T>
struct single_entry {
    K key;
    T value;

    constexpr bool matches(const K & k) const {
        return key_traits<K>::encode(k) == key_traits<K>::encode(key);
    }
};

// Several keys sharing one value. Stored inline: initializer_list storage
// does not outlive the full expression that builds the map.
template<class K, class T, std::size_t N>
struct group_entry {
    std::array<K, N> keys;
    T value;

    constexpr bool matches(const K & k) const {
        const std::size_t index = key_traits<K>::encode(k);
        for (const K & key : keys) {
            if (key_traits<K>::encode(key) == index) return true;
        }
        return false;
    }
};

template<class T>
struct otherwise_value {
    T value;
};

template<class F>
struct otherwise_invoke {
    F fn;
};

template<class T>
struct is_otherwise : std::false_type {};
template<class T>
struct is_otherwise<otherwise_value<T>> : std::true_type {};
template<class F>
struct is_otherwise<otherwise_invoke<F>> : std::true_type {};

template<class T>
struct is_otherwise_fn : std::false_type {};
template<class F>
struct is_otherwise_fn<otherwise_invoke<F>> : std::true_type {};

} // namespace literal_detail


template<class K, class T>
constexpr literal_detail::single_entry<K, std::decay_t<T>> entry(K key, T && value) {
    return {std::move(key), std::forward<T>(value)};
}

template<class K, std::size_t N, class T>
constexpr literal_detail::group_entry<K, std::decay_t<T>, N> entry(const K (&keys)[N], T && value) {
    return {std::to_array(keys), std::forward<T>(value)};
}

template<class T>
constexpr literal_detail::otherwise_value<std::decay_t<T>> otherwise(T && value) {
    return {std::forward<T>(value)};
}

template<class F>
constexpr literal_detail::otherwise_invoke<std::decay_t<F>> otherwise_fn(F && fn) {
    return {std::forward<F>(fn)};
}


/// Declarative construction:
///
///     auto m = enum_map<Example, int>(
///         entry(Example::A, 1),
///         entry({Example::B, Example::C}, 2),
///         otherwise(3));
///
/// For every key the first matching entry supplies the value; keys matched
/// by no entry take the fallback. A key left uncovered is a contract violation.
/// Entry values are copied into the map, so each entry may serve many keys.
template<EnumKey K, class V, class ... Entries>
constexpr EnumMap<K, V> enum_map(const Entries & ... entries) {
    constexpr std::size_t fallbacks = (std::size_t{0} + ... + std::size_t{literal_detail::is_otherwise<Entries>::value});
    static_assert(fallbacks <= 1, "[[[ EnumFusion ]]] enum_map accepts at most one otherwise()");

    return EnumMap<K, V>::from_fn([&](const K & key) -> V {
        std::optional<V> found;
        auto try_entry = [&](const auto & e) -> bool {
            using E = std::remove_cvref_t<decltype(e)>;
            if constexpr (literal_detail::is_otherwise<E>::value) {
                return false;
            } else {
                if (!e.matches(key)) return false;
                found.emplace(e.value);
                return true;
            }
        };
        (void)(try_entry(entries) || ...);
        if (found) return std::move(*found);

        if constexpr (fallbacks == 1) {
            auto fallback = [&](const auto & e) -> bool {
                using E = std::remove_cvref_t<decltype(e)>;
                if constexpr (literal_detail::is_otherwise<E>::value) {
                    if constexpr (literal_detail::is_otherwise_fn<E>::value) {
                        found.emplace(std::invoke(e.fn, key));
                    } else {
                        found.emplace(e.value);
                    }
                    return true;
                } else {
                    return false;
                }
            };
            (void)(fallback(entries) || ...);
            return std::move(*found);
        } else {
            detail::contract_violation("enum_map literal does not cover every key");
        }
    });
}

} // namespace EnumFusion
