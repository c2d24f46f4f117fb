#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>

#include "enum_map.hpp"
#include "errors.hpp"
#include "key_traits.hpp"

namespace EnumFusion {

/// Fuzzer-provided bytes, consumed front to back.
class Unstructured {
public:
    constexpr explicit Unstructured(std::span<const std::uint8_t> data) noexcept : m_data(data) {}

    constexpr std::size_t len() const noexcept { return m_data.size() - m_pos; }
    constexpr bool is_empty() const noexcept { return len() == 0; }

    constexpr ArbitraryError bytes(std::size_t count, std::span<const std::uint8_t> & out) {
        if (count > len()) {
            return ArbitraryError::NOT_ENOUGH_DATA;
        }
        out = m_data.subspan(m_pos, count);
        m_pos += count;
        return ArbitraryError::NO_ERROR;
    }

    /// Little-endian unsigned value built from `count` bytes.
    constexpr ArbitraryError take_le(std::size_t count, std::uint64_t & out) {
        std::span<const std::uint8_t> raw;
        if (ArbitraryError e = bytes(count, raw); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        out = 0;
        for (std::size_t i = 0; i < raw.size(); ++i) {
            out |= static_cast<std::uint64_t>(raw[i]) << (8 * i);
        }
        return ArbitraryError::NO_ERROR;
    }

    /// Index in [0, n), using as few bytes as n - 1 needs. n == 0 has no
    /// index to offer.
    constexpr ArbitraryError choose_index(std::size_t n, std::size_t & out) {
        if (n == 0) {
            return ArbitraryError::NOT_ENOUGH_DATA;
        }
        std::uint64_t raw = 0;
        if (ArbitraryError e = take_le(bytes_for(n - 1), raw); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        out = static_cast<std::size_t>(raw % n);
        return ArbitraryError::NO_ERROR;
    }

    static constexpr std::size_t bytes_for(std::size_t max_value) noexcept {
        std::size_t n = 0;
        while (max_value != 0) {
            ++n;
            max_value >>= 8;
        }
        return n;
    }

private:
    std::span<const std::uint8_t> m_data;
    std::size_t m_pos = 0;
};


/// (min, max) number of bytes one value consumes; max is unknown when nullopt.
struct SizeHint {
    std::size_t min = 0;
    std::optional<std::size_t> max = 0;

    friend constexpr bool operator==(const SizeHint &, const SizeHint &) = default;
};

namespace arbitrary_detail {

constexpr std::size_t saturating_mul(std::size_t a, std::size_t b) noexcept {
    if (b != 0 && a > std::numeric_limits<std::size_t>::max() / b) {
        return std::numeric_limits<std::size_t>::max();
    }
    return a * b;
}

constexpr std::optional<std::size_t> checked_mul(std::optional<std::size_t> a, std::size_t b) noexcept {
    if (!a || (b != 0 && *a > std::numeric_limits<std::size_t>::max() / b)) {
        return std::nullopt;
    }
    return *a * b;
}

constexpr std::optional<std::size_t> checked_add(std::size_t a, std::optional<std::size_t> b) noexcept {
    if (!b || *b > std::numeric_limits<std::size_t>::max() - a) {
        return std::nullopt;
    }
    return a + *b;
}

} // namespace arbitrary_detail


/// Customization point for drawing values out of fuzzer input:
///   static constexpr ArbitraryError arbitrary(Unstructured &, T & out);
///   static constexpr SizeHint size_hint();
template<class T>
struct arbitrary_traits {};

template<class T>
concept Arbitrary = requires(Unstructured & u, T & out) {
    { arbitrary_traits<T>::arbitrary(u, out) } -> std::same_as<ArbitraryError>;
    { arbitrary_traits<T>::size_hint() } -> std::same_as<SizeHint>;
};

template<>
struct arbitrary_traits<bool> {
    static constexpr ArbitraryError arbitrary(Unstructured & u, bool & out) {
        std::uint64_t raw = 0;
        if (ArbitraryError e = u.take_le(1, raw); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        out = (raw & 1) == 1;
        return ArbitraryError::NO_ERROR;
    }
    static constexpr SizeHint size_hint() { return {1, 1}; }
};

template<class T>
    requires (std::is_integral_v<T> && !std::is_same_v<T, bool> && sizeof(T) <= sizeof(std::uint64_t))
struct arbitrary_traits<T> {
    static constexpr ArbitraryError arbitrary(Unstructured & u, T & out) {
        std::uint64_t raw = 0;
        if (ArbitraryError e = u.take_le(sizeof(T), raw); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        out = static_cast<T>(static_cast<std::make_unsigned_t<T>>(raw));
        return ArbitraryError::NO_ERROR;
    }
    static constexpr SizeHint size_hint() { return {sizeof(T), sizeof(T)}; }
};

template<Arbitrary T>
    requires std::default_initializable<T>
struct arbitrary_traits<std::optional<T>> {
    static constexpr ArbitraryError arbitrary(Unstructured & u, std::optional<T> & out) {
        bool some = false;
        if (ArbitraryError e = arbitrary_traits<bool>::arbitrary(u, some); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        if (!some) {
            out.reset();
            return ArbitraryError::NO_ERROR;
        }
        T value{};
        if (ArbitraryError e = arbitrary_traits<T>::arbitrary(u, value); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        out = std::move(value);
        return ArbitraryError::NO_ERROR;
    }
    static constexpr SizeHint size_hint() {
        return {1, arbitrary_detail::checked_add(1, arbitrary_traits<T>::size_hint().max)};
    }
};

// Any other key: draw an index and decode it.
template<EnumKey K>
    requires (!std::is_integral_v<K> && !key_schema::input_checks::is_specialization_of_v<K, std::optional>)
struct arbitrary_traits<K> {
    static constexpr ArbitraryError arbitrary(Unstructured & u, K & out) {
        std::size_t index = 0;
        if (ArbitraryError e = u.choose_index(key_traits<K>::cardinality, index); e != ArbitraryError::NO_ERROR) {
            return e;
        }
        out = key_traits<K>::decode(index);
        return ArbitraryError::NO_ERROR;
    }
    static constexpr SizeHint size_hint() {
        if constexpr (key_traits<K>::cardinality == 0) {
            return {0, 0};
        } else {
            constexpr std::size_t n = Unstructured::bytes_for(key_traits<K>::cardinality - 1);
            return {n, n};
        }
    }
};

/// Values are drawn once per key, in ascending index order. On failure out
/// is left as it was.
template<EnumKey K, Arbitrary V>
    requires std::default_initializable<V>
struct arbitrary_traits<EnumMap<K, V>> {
    static constexpr ArbitraryError arbitrary(Unstructured & u, EnumMap<K, V> & out) {
        ArbitraryError err = ArbitraryError::NO_ERROR;
        auto drawn = EnumMap<K, V>::from_fn([&](const K &) -> V {
            V value{};
            if (err == ArbitraryError::NO_ERROR) {
                err = arbitrary_traits<V>::arbitrary(u, value);
            }
            return value;
        });
        if (err != ArbitraryError::NO_ERROR) {
            return err;
        }
        out = std::move(drawn);
        return ArbitraryError::NO_ERROR;
    }

    static constexpr SizeHint size_hint() {
        constexpr std::size_t len = EnumMap<K, V>::Length;
        if constexpr (len == 0) {
            return {0, 0};
        } else {
            const SizeHint inner = arbitrary_traits<V>::size_hint();
            return {arbitrary_detail::saturating_mul(inner.min, len), arbitrary_detail::checked_mul(inner.max, len)};
        }
    }
};


template<Arbitrary T>
constexpr ArbitraryError arbitrary(Unstructured & u, T & out) {
    return arbitrary_traits<T>::arbitrary(u, out);
}

template<Arbitrary T>
constexpr SizeHint size_hint() {
    return arbitrary_traits<T>::size_hint();
}

} // namespace EnumFusion
