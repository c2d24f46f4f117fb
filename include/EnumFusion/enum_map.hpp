#pragma once

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <ranges>
#include <span>
#include <type_traits>
#include <utility>

#include "key_traits.hpp"
#include "iterators.hpp"

namespace EnumFusion {

template<EnumKey K, class V>
class EnumMap;

namespace map_detail {

struct index_fn_t {};

template<class T>
struct is_enum_map : std::false_type {};

template<class K, class V>
struct is_enum_map<EnumMap<K, V>> : std::true_type {};

} // namespace map_detail

template<class T>
inline constexpr bool is_enum_map_v = map_detail::is_enum_map<std::remove_cvref_t<T>>::value;


/// Total map from every value of K to a V.
///
/// Values live in a std::array ordered by key index; keys are never stored
/// and are recomputed from the position when iterating. The map is always
/// fully populated.
template<EnumKey K, class V>
class EnumMap {
public:
    static constexpr std::size_t Length = key_traits<K>::cardinality;

    using key_type               = K;
    using mapped_type            = V;
    using size_type              = std::size_t;
    using storage_type           = std::array<V, Length>;
    using iterator               = iterators_detail::entry_iterator<K, V>;
    using const_iterator         = iterators_detail::entry_iterator<K, const V>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    constexpr EnumMap() requires std::default_initializable<V> : m_values{} {}

    /// Builds the map by calling f once per key, in ascending index order.
    /// If f throws, the values built so far are destroyed and nothing else.
    template<class F>
        requires std::invocable<F &, K> && std::convertible_to<std::invoke_result_t<F &, K>, V>
    static constexpr EnumMap from_fn(F && f) {
        auto build = [&](std::size_t index) -> V {
            return std::invoke(f, key_traits<K>::decode(index));
        };
        return EnumMap(map_detail::index_fn_t{}, build, std::make_index_sequence<Length>{});
    }

    /// Default-constructed map with the given (key, value) pairs assigned on top.
    template<std::ranges::input_range R>
        requires std::default_initializable<V>
    static constexpr EnumMap from_entries(R && entries) {
        EnumMap result;
        result.extend(std::forward<R>(entries));
        return result;
    }

    constexpr V & operator[](const K & key) {
        return m_values[key_traits<K>::encode(key)];
    }
    constexpr const V & operator[](const K & key) const {
        return m_values[key_traits<K>::encode(key)];
    }
    constexpr V & get(const K & key) {
        return (*this)[key];
    }
    constexpr const V & get(const K & key) const {
        return (*this)[key];
    }

    template<class U>
        requires std::assignable_from<V &, U &&>
    constexpr void set(const K & key, U && value) {
        m_values[key_traits<K>::encode(key)] = std::forward<U>(value);
    }

    /// Exchanges the values stored under two keys.
    constexpr void swap(const K & a, const K & b) {
        using std::swap;
        swap(m_values[key_traits<K>::encode(a)], m_values[key_traits<K>::encode(b)]);
    }

    constexpr void swap(EnumMap & other) noexcept(std::is_nothrow_swappable_v<V>) {
        m_values.swap(other.m_values);
    }
    friend constexpr void swap(EnumMap & a, EnumMap & b) noexcept(std::is_nothrow_swappable_v<V>) {
        a.swap(b);
    }

    /// Assigns map[key] = value for every pair. Values are moved only out of
    /// an owning rvalue range or a range yielding rvalues; otherwise copied.
    template<std::ranges::input_range R>
    constexpr void extend(R && entries) {
        constexpr bool movable = !std::is_lvalue_reference_v<std::ranges::range_reference_t<R>> ||
                                 (!std::is_lvalue_reference_v<R> && !std::ranges::view<std::remove_cvref_t<R>>);
        for (auto && [key, value] : entries) {
            if constexpr (movable) {
                (*this)[key] = std::move(value);
            } else {
                (*this)[key] = value;
            }
        }
    }

    constexpr std::span<const V, Length> as_slice() const noexcept { return std::span<const V, Length>(m_values); }
    constexpr std::span<V, Length> as_mut_slice() noexcept { return std::span<V, Length>(m_values); }
    constexpr std::span<const V, Length> values() const noexcept { return as_slice(); }
    constexpr std::span<V, Length> values() noexcept { return as_mut_slice(); }

    constexpr V * data() noexcept { return m_values.data(); }
    constexpr const V * data() const noexcept { return m_values.data(); }
    static constexpr std::size_t size() noexcept { return Length; }
    static constexpr bool empty() noexcept { return Length == 0; }

    constexpr iterator begin() noexcept { return iterator(m_values.data(), 0); }
    constexpr iterator end() noexcept { return iterator(m_values.data(), Length); }
    constexpr const_iterator begin() const noexcept { return const_iterator(m_values.data(), 0); }
    constexpr const_iterator end() const noexcept { return const_iterator(m_values.data(), Length); }
    constexpr const_iterator cbegin() const noexcept { return begin(); }
    constexpr const_iterator cend() const noexcept { return end(); }
    constexpr reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
    constexpr reverse_iterator rend() noexcept { return reverse_iterator(begin()); }
    constexpr const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator(end()); }
    constexpr const_reverse_iterator rend() const noexcept { return const_reverse_iterator(begin()); }

    constexpr iterators_detail::entries_view<K, const V> iter() const noexcept {
        return {m_values.data(), Length};
    }
    constexpr iterators_detail::entries_view<K, V> iter_mut() noexcept {
        return {m_values.data(), Length};
    }

    /// Consumes the map. Values not taken out of the returned range are
    /// destroyed together with it.
    constexpr iterators_detail::owned_entries<K, V, Length> into_entries() && {
        return iterators_detail::owned_entries<K, V, Length>(std::move(m_values));
    }

    /// Consuming transform: f(K, V&&) -> U. The source keeps its (moved-from)
    /// values and destroys them as usual.
    template<class F>
        requires std::invocable<F &, K, V &&>
    constexpr auto map(F && f) && {
        using U = std::remove_cvref_t<std::invoke_result_t<F &, K, V &&>>;
        auto build = [&](std::size_t index) -> U {
            return std::invoke(f, key_traits<K>::decode(index), std::move(m_values[index]));
        };
        return EnumMap<K, U>(map_detail::index_fn_t{}, build, std::make_index_sequence<Length>{});
    }

    template<class F>
        requires std::invocable<F &, K, const V &>
    constexpr auto map(F && f) const & {
        using U = std::remove_cvref_t<std::invoke_result_t<F &, K, const V &>>;
        auto build = [&](std::size_t index) -> U {
            return std::invoke(f, key_traits<K>::decode(index), m_values[index]);
        };
        return EnumMap<K, U>(map_detail::index_fn_t{}, build, std::make_index_sequence<Length>{});
    }

    friend constexpr bool operator==(const EnumMap &, const EnumMap &) = default;
    friend constexpr auto operator<=>(const EnumMap &, const EnumMap &) = default;

private:
    template<EnumKey, class>
    friend class EnumMap;

    // Elements are initialized left to right; if build(I) throws, exactly
    // the already constructed prefix is destroyed.
    template<class Build, std::size_t ... I>
    constexpr EnumMap(map_detail::index_fn_t, Build & build, std::index_sequence<I...>)
        : m_values{{build(I)...}} {}

    storage_type m_values;
};


/// from_fn with the value type deduced from f.
template<EnumKey K, class F>
    requires std::invocable<F &, K>
constexpr auto from_fn(F && f) {
    using V = std::remove_cvref_t<std::invoke_result_t<F &, K>>;
    return EnumMap<K, V>::from_fn(std::forward<F>(f));
}

} // namespace EnumFusion


template<class K, class V>
    requires requires (const V & v) { { std::hash<V>{}(v) } -> std::convertible_to<std::size_t>; }
struct std::hash<EnumFusion::EnumMap<K, V>> {
    std::size_t operator()(const EnumFusion::EnumMap<K, V> & map) const noexcept {
        std::size_t seed = EnumFusion::EnumMap<K, V>::Length;
        for (const V & v : map.values()) {
            seed ^= std::hash<V>{}(v) + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
        }
        return seed;
    }
};
