#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace EnumFusion {

template <typename CharT, std::size_t N> struct ConstString
{
    // Names end up inside the textual key form, so they may not contain
    // characters the key grammar reserves.
    constexpr bool check() const {
        if constexpr (N == 0) {
            return false;
        } else {
            for(std::size_t i = 0; i < N; i ++) {
                const CharT c = m_data[i];
                if(std::uint8_t(c) < 32) return false;
                if(c == '(' || c == ')' || c == ',' || c == ' ') return false;
            }
            return !(m_data[0] >= '0' && m_data[0] <= '9') && m_data[0] != '-';
        }
    }
    constexpr ConstString(const CharT (&foo)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = foo[i];
        }
    }
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;
    constexpr std::string_view toStringView() const {
        return {&m_data[0], &m_data[Length]};
    }
    constexpr bool operator==(std::string_view other) const {
        return toStringView() == other;
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

}
