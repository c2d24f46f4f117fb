#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>

#include "key_traits.hpp"

namespace EnumFusion {

namespace iterators_detail {

/// Random access iterator over an index-ordered value array that yields
/// (key, value) pairs. Keys are never stored: each dereference decodes the
/// current index.
///
///  - Value = V        yields std::pair<K, V&>
///  - Value = const V  yields std::pair<K, const V&>
///  - Move = true      yields std::pair<K, V> and moves the value out; every
///                     position must be dereferenced at most once
template<class K, class Value, bool Move = false>
class entry_iterator {
public:
    using iterator_concept  = std::random_access_iterator_tag;
    using iterator_category = std::input_iterator_tag;
    using value_type        = std::pair<K, std::remove_const_t<Value>>;
    using reference         = std::conditional_t<Move, std::pair<K, Value>, std::pair<K, Value &>>;
    using difference_type   = std::ptrdiff_t;

    constexpr entry_iterator() = default;
    constexpr entry_iterator(Value * base, std::size_t index) noexcept : m_base(base), m_index(index) {}

    // iterator -> const_iterator
    template<class Other>
        requires (!Move && std::is_same_v<Value, const Other>)
    constexpr entry_iterator(const entry_iterator<K, Other, false> & other) noexcept
        : m_base(other.base()), m_index(other.index()) {}

    constexpr reference operator*() const {
        if constexpr (Move) {
            return reference{key_traits<K>::decode(m_index), std::move(m_base[m_index])};
        } else {
            return reference{key_traits<K>::decode(m_index), m_base[m_index]};
        }
    }
    constexpr reference operator[](difference_type n) const {
        return *(*this + n);
    }

    constexpr K key() const {
        return key_traits<K>::decode(m_index);
    }
    constexpr Value & value() const noexcept {
        return m_base[m_index];
    }
    constexpr std::size_t index() const noexcept {
        return m_index;
    }
    constexpr Value * base() const noexcept {
        return m_base;
    }

    constexpr entry_iterator & operator++() noexcept {
        ++m_index;
        return *this;
    }
    constexpr entry_iterator operator++(int) noexcept {
        entry_iterator tmp = *this;
        ++m_index;
        return tmp;
    }
    constexpr entry_iterator & operator--() noexcept {
        --m_index;
        return *this;
    }
    constexpr entry_iterator operator--(int) noexcept {
        entry_iterator tmp = *this;
        --m_index;
        return tmp;
    }
    constexpr entry_iterator & operator+=(difference_type n) noexcept {
        m_index = static_cast<std::size_t>(static_cast<difference_type>(m_index) + n);
        return *this;
    }
    constexpr entry_iterator & operator-=(difference_type n) noexcept {
        return *this += -n;
    }

    friend constexpr entry_iterator operator+(entry_iterator it, difference_type n) noexcept {
        return it += n;
    }
    friend constexpr entry_iterator operator+(difference_type n, entry_iterator it) noexcept {
        return it += n;
    }
    friend constexpr entry_iterator operator-(entry_iterator it, difference_type n) noexcept {
        return it -= n;
    }
    friend constexpr difference_type operator-(const entry_iterator & a, const entry_iterator & b) noexcept {
        return static_cast<difference_type>(a.m_index) - static_cast<difference_type>(b.m_index);
    }
    friend constexpr bool operator==(const entry_iterator & a, const entry_iterator & b) noexcept {
        return a.m_index == b.m_index;
    }
    friend constexpr std::strong_ordering operator<=>(const entry_iterator & a, const entry_iterator & b) noexcept {
        return a.m_index <=> b.m_index;
    }

private:
    Value * m_base = nullptr;
    std::size_t m_index = 0;
};


template<class It>
class reversed_view {
public:
    using iterator = std::reverse_iterator<It>;

    constexpr reversed_view(It first, It last) noexcept : m_first(first), m_last(last) {}

    constexpr iterator begin() const noexcept { return iterator(m_last); }
    constexpr iterator end() const noexcept { return iterator(m_first); }
    constexpr std::size_t size() const noexcept { return static_cast<std::size_t>(m_last - m_first); }
    constexpr bool empty() const noexcept { return m_first == m_last; }

private:
    It m_first;
    It m_last;
};

/// Borrowing view over all entries of a map, returned by EnumMap::iter().
template<class K, class Value>
class entries_view {
public:
    using iterator = entry_iterator<K, Value>;

    constexpr entries_view(Value * data, std::size_t size) noexcept : m_data(data), m_size(size) {}

    constexpr iterator begin() const noexcept { return iterator(m_data, 0); }
    constexpr iterator end() const noexcept { return iterator(m_data, m_size); }
    constexpr std::size_t size() const noexcept { return m_size; }
    constexpr bool empty() const noexcept { return m_size == 0; }

    constexpr reversed_view<iterator> reversed() const noexcept {
        return {begin(), end()};
    }

private:
    Value * m_data;
    std::size_t m_size;
};


/// Owning range produced by EnumMap::into_entries(). It takes the values
/// over and hands them out by value, front to back (or back to front through
/// rbegin()). Values that are never yielded die with the range.
template<class K, class V, std::size_t N>
class owned_entries {
public:
    using iterator = entry_iterator<K, V, true>;
    using reverse_iterator = std::reverse_iterator<iterator>;

    constexpr explicit owned_entries(std::array<V, N> && values) : m_values(std::move(values)) {}

    owned_entries(const owned_entries &) = delete;
    owned_entries & operator=(const owned_entries &) = delete;
    constexpr owned_entries(owned_entries &&) = default;
    constexpr owned_entries & operator=(owned_entries &&) = default;

    constexpr iterator begin() noexcept { return iterator(m_values.data(), 0); }
    constexpr iterator end() noexcept { return iterator(m_values.data(), N); }
    constexpr reverse_iterator rbegin() noexcept { return reverse_iterator(end()); }
    constexpr reverse_iterator rend() noexcept { return reverse_iterator(begin()); }

    constexpr std::size_t size() const noexcept { return N; }
    constexpr bool empty() const noexcept { return N == 0; }

private:
    std::array<V, N> m_values;
};

} // namespace iterators_detail

} // namespace EnumFusion
