#pragma once

#include <format>
#include <string_view>
#include <type_traits>

#include "enum_map.hpp"
#include "key_name.hpp"

namespace EnumFusion::format_detail {

template<class Out>
struct text_sink {
    Out & out;
    constexpr void operator()(std::string_view piece) {
        for (char c : piece) {
            *out++ = c;
        }
    }
};

template<class K, class Out>
Out write_key(const K & key, Out out) {
    text_sink<Out> sink{out};
    key_text::write(key, sink);
    return out;
}

// std::formatter may only be specialized for program-defined types.
template<class K>
concept UserKey = KeyTextual<K> &&
                  (std::is_enum_v<K> || key_schema::key_kind_v<K> == key_schema::KeyKind::product_struct);

} // namespace EnumFusion::format_detail


/// {k0: v0, k1: v1}, keys in their textual form, values through their own
/// formatter (or their textual form when they are keys without one).
template<class K, class V>
    requires (std::formattable<V, char> || EnumFusion::KeyTextual<V>)
struct std::formatter<EnumFusion::EnumMap<K, V>, char> {
    constexpr auto parse(std::format_parse_context & ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("EnumMap takes no format specification");
        }
        return it;
    }

    template<class FormatContext>
    auto format(const EnumFusion::EnumMap<K, V> & map, FormatContext & ctx) const {
        auto out = ctx.out();
        *out++ = '{';
        bool first = true;
        for (auto && [key, value] : map) {
            if (!first) {
                *out++ = ',';
                *out++ = ' ';
            }
            first = false;
            out = EnumFusion::format_detail::write_key(key, out);
            *out++ = ':';
            *out++ = ' ';
            if constexpr (std::formattable<V, char>) {
                out = std::format_to(out, "{}", value);
            } else {
                out = EnumFusion::format_detail::write_key(value, out);
            }
        }
        *out++ = '}';
        return out;
    }
};

template<EnumFusion::format_detail::UserKey K>
struct std::formatter<K, char> {
    constexpr auto parse(std::format_parse_context & ctx) {
        auto it = ctx.begin();
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("keys take no format specification");
        }
        return it;
    }

    template<class FormatContext>
    auto format(const K & key, FormatContext & ctx) const {
        return EnumFusion::format_detail::write_key(key, ctx.out());
    }
};
