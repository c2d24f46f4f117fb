#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "key_meta.hpp"
#include "key_schema.hpp"
#include "key_traits.hpp"

#ifndef ENUMFUSION_KEY_TEXT_MAX_DEPTH
#define ENUMFUSION_KEY_TEXT_MAX_DEPTH 32
#endif

namespace EnumFusion {

/// Textual form of keys, used for JSON member names, key-typed JSON values
/// and pretty-printing:
///
///   bool             false | true
///   byte             decimal, e.g. 97 or -3
///   named index      the name, e.g. Red (unit enums, or any key_traits
///                    that exposes `static std::string_view name(std::size_t)`)
///   unit             ()
///   optional         None | Some(x)
///   product          (a,b,...)
///   variant          label, then nothing for a unit alternative, the product
///                    form for a product alternative, else (x).
///                    The label is KeyMeta<A>::name / A::name, or the decimal
///                    position of the alternative when it has no name.
///                    Two alternatives with the same name are rejected at
///                    compile time.
namespace key_text {

namespace detail {

using key_schema::KeyKind;

template<class K>
concept NamedIndex = requires(std::size_t i) {
    { key_traits<K>::name(i) } -> std::convertible_to<std::string_view>;
};

template<class K>
consteval bool has_text();

template<class K, std::size_t ... I>
consteval bool product_has_text(std::index_sequence<I...>) {
    using Access = key_schema::product_access<K>;
    return (has_text<typename Access::template element_type<I>>() && ...);
}

template<class K, std::size_t ... I>
consteval bool variant_has_text(std::index_sequence<I...>) {
    return (has_text<std::variant_alternative_t<I, K>>() && ...);
}

template<class A>
constexpr std::string_view alternative_label() {
    if constexpr (HasKeyName<A>) {
        return key_name_of<A>();
    } else {
        return {};
    }
}

// Unnamed alternatives are labelled by position and names never start with a
// digit, so only named alternatives can collide.
template<class K>
consteval bool variant_labels_distinct() {
    return []<std::size_t ... I>(std::index_sequence<I...>) {
        constexpr std::size_t n = sizeof...(I);
        const std::string_view labels[n] = {alternative_label<std::variant_alternative_t<I, K>>()...};
        for (std::size_t i = 0; i < n; ++i) {
            for (std::size_t j = i + 1; j < n; ++j) {
                if (!labels[i].empty() && labels[i] == labels[j]) return false;
            }
        }
        return true;
    }(std::make_index_sequence<std::variant_size_v<K>>{});
}

template<class K>
consteval bool has_text() {
    constexpr KeyKind kind = key_schema::key_kind_v<K>;
    if constexpr (!EnumKey<K>) {
        return false;
    } else if constexpr (kind == KeyKind::boolean || kind == KeyKind::byte || NamedIndex<K> || kind == KeyKind::unit) {
        return true;
    } else if constexpr (kind == KeyKind::optional) {
        return has_text<typename K::value_type>();
    } else if constexpr (kind == KeyKind::sum) {
        return variant_has_text<K>(std::make_index_sequence<std::variant_size_v<K>>{});
    } else if constexpr (key_schema::ProductKey<K>) {
        return product_has_text<K>(std::make_index_sequence<key_schema::product_access<K>::count>{});
    } else {
        return false;
    }
}

template<class Int>
constexpr std::size_t format_decimal(Int value, char (&buf)[8]) {
    char tmp[8];
    std::size_t n = 0;
    int v = static_cast<int>(value);
    const bool negative = v < 0;
    if (negative) v = -v;
    do {
        tmp[n++] = static_cast<char>('0' + v % 10);
        v /= 10;
    } while (v != 0);
    std::size_t len = 0;
    if (negative) buf[len++] = '-';
    while (n > 0) buf[len++] = tmp[--n];
    return len;
}

} // namespace detail

template<class K>
concept KeyTextual = detail::has_text<K>();


template<KeyTextual K, class Sink>
    requires std::invocable<Sink &, std::string_view>
constexpr void write(const K & key, Sink & sink);

namespace detail {

template<class K, class Sink>
constexpr void write_product_fields(const K & key, Sink & sink) {
    using Access = key_schema::product_access<K>;
    sink(std::string_view{"("});
    [&]<std::size_t ... I>(std::index_sequence<I...>) {
        ((sink(std::string_view{I == 0 ? "" : ","}), key_text::write(Access::template get<I>(key), sink)), ...);
    }(std::make_index_sequence<Access::count>{});
    sink(std::string_view{")"});
}

template<class A, std::size_t I, class Sink>
constexpr void write_alternative(const A & alt, Sink & sink) {
    if constexpr (HasKeyName<A>) {
        sink(key_name_of<A>());
    } else {
        char buf[8];
        const std::size_t len = format_decimal(static_cast<int>(I), buf);
        sink(std::string_view(buf, len));
    }
    if constexpr (key_schema::is_unit_shaped<A>()) {
        return;
    } else if constexpr (key_schema::ProductKey<A> && !NamedIndex<A>) {
        write_product_fields(alt, sink);
    } else {
        sink(std::string_view{"("});
        key_text::write(alt, sink);
        sink(std::string_view{")"});
    }
}

} // namespace detail


/// Streams the textual form of key into sink, piece by piece.
template<KeyTextual K, class Sink>
    requires std::invocable<Sink &, std::string_view>
constexpr void write(const K & key, Sink & sink) {
    using detail::KeyKind;
    constexpr KeyKind kind = key_schema::key_kind_v<K>;

    if constexpr (kind == KeyKind::boolean) {
        sink(key ? std::string_view{"true"} : std::string_view{"false"});
    } else if constexpr (kind == KeyKind::byte) {
        char buf[8];
        const std::size_t len = detail::format_decimal(key, buf);
        sink(std::string_view(buf, len));
    } else if constexpr (detail::NamedIndex<K>) {
        sink(std::string_view{key_traits<K>::name(key_traits<K>::encode(key))});
    } else if constexpr (kind == KeyKind::unit) {
        sink(std::string_view{"()"});
    } else if constexpr (kind == KeyKind::optional) {
        if (!key.has_value()) {
            sink(std::string_view{"None"});
        } else {
            sink(std::string_view{"Some("});
            key_text::write(*key, sink);
            sink(std::string_view{")"});
        }
    } else if constexpr (kind == KeyKind::sum) {
        static_assert(detail::variant_labels_distinct<K>(),
                      "[[[ EnumFusion ]]] std::variant key has two alternatives with the same name");
        if (key.valueless_by_exception()) {
            EnumFusion::detail::contract_violation("valueless std::variant used as a key");
        }
        [&]<std::size_t ... I>(std::index_sequence<I...>) {
            (void)((key.index() == I
                        ? (detail::write_alternative<std::variant_alternative_t<I, K>, I>(*std::get_if<I>(&key), sink), true)
                        : false) || ...);
        }(std::make_index_sequence<std::variant_size_v<K>>{});
    } else {
        detail::write_product_fields(key, sink);
    }
}

template<KeyTextual K>
constexpr std::string to_string(const K & key) {
    std::string out;
    auto sink = [&](std::string_view piece) { out.append(piece); };
    key_text::write(key, sink);
    return out;
}


namespace detail {

// Recursive descent over the grammar above. Every reader either consumes a
// complete production and returns a value, or returns nullopt.
struct cursor {
    std::string_view text;
    std::size_t pos = 0;
    std::size_t depth = 0;

    constexpr bool at_end() const { return pos == text.size(); }

    constexpr bool eat(char c) {
        if (pos < text.size() && text[pos] == c) {
            ++pos;
            return true;
        }
        return false;
    }

    constexpr bool eat(std::string_view lit) {
        if (text.substr(pos, lit.size()) == lit) {
            pos += lit.size();
            return true;
        }
        return false;
    }

    // Name or number: everything up to the next delimiter.
    constexpr std::string_view token() {
        const std::size_t start = pos;
        while (pos < text.size() && text[pos] != '(' && text[pos] != ')' && text[pos] != ',') {
            ++pos;
        }
        return text.substr(start, pos - start);
    }
};

// Canonical decimal only: no sign on zero, no leading zeros, no '+'.
constexpr bool parse_decimal(std::string_view tok, long long & out) {
    bool negative = false;
    if (!tok.empty() && tok[0] == '-') {
        negative = true;
        tok.remove_prefix(1);
    }
    if (tok.empty() || tok.size() > 12) return false;
    if (tok[0] == '0' && (tok.size() > 1 || negative)) return false;
    long long v = 0;
    for (char c : tok) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = negative ? -v : v;
    return true;
}

template<class K>
constexpr std::optional<K> read(cursor & c);

struct depth_guard {
    cursor & c;
    bool ok;
    constexpr explicit depth_guard(cursor & cur) : c(cur), ok(++cur.depth <= ENUMFUSION_KEY_TEXT_MAX_DEPTH) {}
    constexpr ~depth_guard() { --c.depth; }
};

template<class K>
constexpr std::optional<K> read_product_fields(cursor & c) {
    using Access = key_schema::product_access<K>;
    if (!c.eat('(')) return std::nullopt;
    return [&]<std::size_t ... I>(std::index_sequence<I...>) -> std::optional<K> {
        std::tuple<std::optional<typename Access::template element_type<I>>...> fields;
        const bool ok = ((
            (I == 0 || c.eat(',')) &&
            (std::get<I>(fields) = read<typename Access::template element_type<I>>(c)).has_value()) && ...);
        if (!ok || !c.eat(')')) return std::nullopt;
        return Access::make(std::move(*std::get<I>(fields))...);
    }(std::make_index_sequence<Access::count>{});
}

template<class A, std::size_t I>
constexpr bool alternative_label_matches(std::string_view label) {
    if constexpr (HasKeyName<A>) {
        return label == key_name_of<A>();
    } else {
        long long idx = 0;
        return parse_decimal(label, idx) && idx == static_cast<long long>(I);
    }
}

template<class K, std::size_t I>
constexpr std::optional<K> read_alternative(cursor & c) {
    using A = std::variant_alternative_t<I, K>;
    std::optional<A> alt;
    if constexpr (key_schema::is_unit_shaped<A>()) {
        alt = key_traits<A>::decode(0);
    } else if constexpr (key_schema::ProductKey<A> && !NamedIndex<A>) {
        alt = read_product_fields<A>(c);
    } else {
        if (!c.eat('(')) return std::nullopt;
        alt = read<A>(c);
        if (!alt || !c.eat(')')) return std::nullopt;
    }
    if (!alt) return std::nullopt;
    return K{std::in_place_index<I>, std::move(*alt)};
}

template<class K>
constexpr std::optional<K> read(cursor & c) {
    using key_schema::KeyKind;
    constexpr KeyKind kind = key_schema::key_kind_v<K>;

    depth_guard guard(c);
    if (!guard.ok) return std::nullopt;

    if constexpr (kind == KeyKind::boolean) {
        const std::string_view tok = c.token();
        if (tok == "true") return true;
        if (tok == "false") return false;
        return std::nullopt;
    } else if constexpr (kind == KeyKind::byte) {
        long long v = 0;
        if (!parse_decimal(c.token(), v)) return std::nullopt;
        if (v < std::numeric_limits<K>::lowest() || v > std::numeric_limits<K>::max()) return std::nullopt;
        return static_cast<K>(v);
    } else if constexpr (NamedIndex<K>) {
        const std::string_view tok = c.token();
        for (std::size_t i = 0; i < key_traits<K>::cardinality; i ++) {
            if (std::string_view{key_traits<K>::name(i)} == tok) return key_traits<K>::decode(i);
        }
        return std::nullopt;
    } else if constexpr (kind == KeyKind::unit) {
        if (!c.eat("()")) return std::nullopt;
        return K{};
    } else if constexpr (kind == KeyKind::optional) {
        if (c.eat("None")) return K{std::nullopt};
        if (!c.eat("Some(")) return std::nullopt;
        auto inner = read<typename K::value_type>(c);
        if (!inner || !c.eat(')')) return std::nullopt;
        return K{std::in_place, std::move(*inner)};
    } else if constexpr (kind == KeyKind::sum) {
        static_assert(variant_labels_distinct<K>(),
                      "[[[ EnumFusion ]]] std::variant key has two alternatives with the same name");
        const std::string_view label = c.token();
        std::optional<K> out;
        [&]<std::size_t ... I>(std::index_sequence<I...>) {
            (void)((alternative_label_matches<std::variant_alternative_t<I, K>, I>(label)
                        ? (out = read_alternative<K, I>(c), true)
                        : false) || ...);
        }(std::make_index_sequence<std::variant_size_v<K>>{});
        return out;
    } else {
        return read_product_fields<K>(c);
    }
}

} // namespace detail


/// Parses the whole of text as a K; nullopt if text is not exactly the
/// textual form of some key.
template<KeyTextual K>
constexpr std::optional<K> parse(std::string_view text) {
    detail::cursor c{text};
    std::optional<K> out = detail::read<K>(c);
    if (!out || !c.at_end()) return std::nullopt;
    return out;
}

} // namespace key_text

using key_text::KeyTextual;

} // namespace EnumFusion
