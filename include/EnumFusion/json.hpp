#pragma once

#include <cstdint>
#include <cstddef>
#include <limits>
#include <string_view>
#include <type_traits>

#include "io.hpp"

namespace EnumFusion {

enum class JsonIteratorReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    EXCESS_CHARACTERS,
    ILLFORMED_NULL,
    ILLFORMED_BOOL,
    ILLFORMED_OBJECT,
    ILLFORMED_STRING,
    ILLFORMED_NUMBER,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE
};

constexpr std::string_view error_to_string(JsonIteratorReaderError e) {
    switch(e) {
    case JsonIteratorReaderError::NO_ERROR: return "NO_ERROR"; break;
    case JsonIteratorReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case JsonIteratorReaderError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS"; break;
    case JsonIteratorReaderError::ILLFORMED_NULL: return "ILLFORMED_NULL"; break;
    case JsonIteratorReaderError::ILLFORMED_BOOL: return "ILLFORMED_BOOL"; break;
    case JsonIteratorReaderError::ILLFORMED_OBJECT: return "ILLFORMED_OBJECT"; break;
    case JsonIteratorReaderError::ILLFORMED_STRING: return "ILLFORMED_STRING"; break;
    case JsonIteratorReaderError::ILLFORMED_NUMBER: return "ILLFORMED_NUMBER"; break;
    case JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    }
    return "N/A";
}

namespace json_detail {

// Longest integer token: sign + 20 digits of uint64 + terminator.
inline constexpr std::size_t NumberBufSize = 24;

} // namespace json_detail


template<class It, class Sent>
class JsonIteratorReader {
public:
    using iterator_type = It;
    struct MapFrame {};

    using error_type = JsonIteratorReaderError;

    constexpr JsonIteratorReader(It first, Sent last)
        : m_error(JsonIteratorReaderError::NO_ERROR), current_(first), end_(last) {}

    constexpr reader::TryParseStatus start_value_and_try_read_null() {
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if (*current_ != 'n') {
            return reader::TryParseStatus::no_match;
        }
        ++current_;
        if (!match_literal("ull") || !atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NULL);
            return reader::TryParseStatus::error;
        }
        return reader::TryParseStatus::ok;
    }

    constexpr reader::TryParseStatus read_bool(bool & b) {
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        switch(*current_) {
        case 't':
            ++current_;
            if (match_literal("rue") && atPlainEnd()) {
                b = true;
                return reader::TryParseStatus::ok;
            }
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        case 'f':
            ++current_;
            if (match_literal("alse") && atPlainEnd()) {
                b = false;
                return reader::TryParseStatus::ok;
            }
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        default:
            return reader::TryParseStatus::no_match;
        }
    }

    constexpr bool finish() {
        skip_whitespace();
        if (!atEnd()) {
            setError(JsonIteratorReaderError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

    constexpr reader::IterationStatus read_map_begin(MapFrame&) {
        reader::IterationStatus ret;
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(*current_ != '{')  {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        ++current_;
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(*current_ == '}') {
            ++current_;
        } else if(*current_ == '"') {
            ret.has_value = true;
        } else {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return ret;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    constexpr reader::IterationStatus advance_after_value(MapFrame&) {
        reader::IterationStatus ret{};
        skip_whitespace();
        if (atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        const char c = *current_;
        if (c == '}') {
            ++current_;
            ret.status = reader::TryParseStatus::ok;
            return ret;
        }
        if (c != ',') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return ret;
        }
        ++current_;
        skip_whitespace();
        if (atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        // { "a": 1, } and { "a": 1, , ... }
        if (*current_ != '"') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return ret;
        }
        ret.has_value = true;
        ret.status    = reader::TryParseStatus::ok;
        return ret;
    }

    constexpr bool move_to_value(MapFrame&) {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(*current_ != ':') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
        ++current_;
        skip_whitespace();
        return true;
    }

    constexpr It current() const { return current_; }
    constexpr JsonIteratorReaderError getError() const { return m_error; }

    /// Integers only: a fraction or an exponent is a no_match for the caller
    /// to report as a type mismatch.
    template<class NumberT>
    constexpr reader::TryParseStatus read_number(NumberT & storage) {
        static_assert(std::is_integral_v<NumberT> && !std::is_same_v<NumberT, bool>,
                      "[[[ EnumFusion ]]] only integral numbers are supported");
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        const char first = *current_;
        if(first != '-' && (first < '0' || first > '9')) {
            return reader::TryParseStatus::no_match;
        }

        char buf[json_detail::NumberBufSize];
        std::size_t index = 0;
        bool fractional = false;
        if(!read_number_token(buf, index, fractional)) {
            return reader::TryParseStatus::error;
        }
        if(fractional) {
            return reader::TryParseStatus::no_match;
        }
        NumberT value{};
        if(!parse_decimal_integer<NumberT>(buf, value)) {
            setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
            return reader::TryParseStatus::error;
        }
        storage = value;
        return reader::TryParseStatus::ok;
    }

    /// Fills out with up to capacity decoded bytes of the current string.
    /// Call repeatedly until done; escapes that straddle a chunk boundary are
    /// carried over in a small internal buffer.
    constexpr reader::StringChunkResult read_string_chunk(char* out, std::size_t capacity) {
        std::size_t written = 0;

        if (!in_string_) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return {reader::StringChunkStatus::error, 0, false};
            }
            if (*current_ != '"') {
                return {reader::StringChunkStatus::no_match, 0, false};
            }
            in_string_ = true;
            ++current_;
        }

        auto fail = [&](JsonIteratorReaderError e) {
            setError(e);
            in_string_      = false;
            string_buf_len_ = 0;
            string_buf_pos_ = 0;
            return reader::StringChunkResult{reader::StringChunkStatus::error, written, false};
        };

        auto capacity_full = [&]() {
            if (string_buf_pos_ == string_buf_len_ && !atEnd() && *current_ == '"') {
                ++current_;
                in_string_      = false;
                string_buf_len_ = 0;
                string_buf_pos_ = 0;
                return reader::StringChunkResult{reader::StringChunkStatus::ok, written, true};
            }
            return reader::StringChunkResult{reader::StringChunkStatus::ok, written, false};
        };

        while (string_buf_pos_ < string_buf_len_ && written < capacity) {
            out[written++] = string_buf_[string_buf_pos_++];
        }
        if (string_buf_pos_ < string_buf_len_) {
            return capacity_full();
        }
        string_buf_pos_ = 0;
        string_buf_len_ = 0;

        while (written < capacity) {
            if (atEnd()) {
                return fail(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            }
            const char c = *current_;
            const auto uc = static_cast<unsigned char>(c);

            if (c == '"') {
                ++current_;
                in_string_ = false;
                return {reader::StringChunkStatus::ok, written, true};
            }
            if (uc <= 0x1F) {
                return fail(JsonIteratorReaderError::ILLFORMED_STRING);
            }
            if (c != '\\') {
                out[written++] = c;
                ++current_;
                continue;
            }

            ++current_;
            if (atEnd()) {
                return fail(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            }
            const char esc = *current_;
            ++current_;

            char simple = 0;
            switch (esc) {
            case '"':  simple = '"';  break;
            case '/':  simple = '/';  break;
            case '\\': simple = '\\'; break;
            case 'b':  simple = '\b'; break;
            case 'f':  simple = '\f'; break;
            case 'r':  simple = '\r'; break;
            case 'n':  simple = '\n'; break;
            case 't':  simple = '\t'; break;
            case 'u':  break;
            default:
                return fail(JsonIteratorReaderError::ILLFORMED_STRING);
            }
            if (esc != 'u') {
                out[written++] = simple;
                continue;
            }

            std::uint16_t u1 = 0;
            if (!readHex4(u1)) {
                return fail(m_error);
            }
            std::uint32_t codepoint = u1;
            if (u1 >= 0xD800u && u1 <= 0xDBFFu) {
                if (!match_literal("\\u")) {
                    return fail(atEnd() ? JsonIteratorReaderError::UNEXPECTED_END_OF_DATA
                                        : JsonIteratorReaderError::ILLFORMED_STRING);
                }
                std::uint16_t u2 = 0;
                if (!readHex4(u2)) {
                    return fail(m_error);
                }
                if (u2 < 0xDC00u || u2 > 0xDFFFu) {
                    return fail(JsonIteratorReaderError::ILLFORMED_STRING);
                }
                codepoint = 0x10000u
                            + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10)
                            + (static_cast<std::uint32_t>(u2) - 0xDC00u);
            } else if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
                // lone low surrogate
                return fail(JsonIteratorReaderError::ILLFORMED_STRING);
            }

            char utf8[4];
            std::size_t utf8_len = 0;
            if (codepoint <= 0x7Fu) {
                utf8[utf8_len++] = static_cast<char>(codepoint);
            } else if (codepoint <= 0x7FFu) {
                utf8[utf8_len++] = static_cast<char>(0xC0 | (codepoint >> 6));
                utf8[utf8_len++] = static_cast<char>(0x80 | (codepoint & 0x3F));
            } else if (codepoint <= 0xFFFFu) {
                utf8[utf8_len++] = static_cast<char>(0xE0 | (codepoint >> 12));
                utf8[utf8_len++] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                utf8[utf8_len++] = static_cast<char>(0x80 | (codepoint & 0x3F));
            } else {
                utf8[utf8_len++] = static_cast<char>(0xF0 | (codepoint >> 18));
                utf8[utf8_len++] = static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
                utf8[utf8_len++] = static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                utf8[utf8_len++] = static_cast<char>(0x80 | (codepoint & 0x3F));
            }

            std::size_t i = 0;
            while (i < utf8_len && written < capacity) {
                out[written++] = utf8[i++];
            }
            if (i < utf8_len) {
                string_buf_len_ = utf8_len - i;
                for (std::size_t j = 0; j < string_buf_len_; ++j) {
                    string_buf_[j] = utf8[i + j];
                }
                return capacity_full();
            }
        }
        return capacity_full();
    }

private:
    constexpr void setError(JsonIteratorReaderError e) {
        m_error = e;
    }

    constexpr bool atEnd() const {
        return current_ == end_;
    }

    static constexpr bool isSpace(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    constexpr bool atPlainEnd() {
        if(atEnd()) return true;
        switch(*current_) {
        case ']':
        case ',':
        case '}':
        case ':':
            return true;
        }
        return isSpace(*current_);
    }

    constexpr void skip_whitespace() {
        while (current_ != end_ && isSpace(*current_)) {
            ++current_;
        }
    }

    constexpr bool match_literal(std::string_view lit) {
        for (char c : lit) {
            if (atEnd() || *current_ != c)  {
                return false;
            }
            ++current_;
        }
        return true;
    }

    constexpr bool readHex4(std::uint16_t &out) {
        out = 0;
        for (int i = 0; i < 4; ++i) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char ch = *current_;
            std::uint8_t v;
            if (ch >= '0' && ch <= '9') {
                v = static_cast<std::uint8_t>(ch - '0');
            } else if (ch >= 'A' && ch <= 'F') {
                v = static_cast<std::uint8_t>(ch - 'A' + 10);
            } else if (ch >= 'a' && ch <= 'f') {
                v = static_cast<std::uint8_t>(ch - 'a' + 10);
            } else  {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            out = static_cast<std::uint16_t>((out << 4) | v);
            ++current_;
        }
        return true;
    }

    // Consumes a whole RFC 8259 number. Only the integer part lands in buf;
    // `fractional` reports a fraction or exponent.
    constexpr bool read_number_token(char (&buf)[json_detail::NumberBufSize], std::size_t & index, bool & fractional) {
        index = 0;
        fractional = false;
        if (*current_ == '-') {
            buf[index++] = '-';
            ++current_;
        }
        std::size_t digits = 0;
        bool leadingZero = false;
        while (!atEnd() && *current_ >= '0' && *current_ <= '9') {
            if (digits == 1 && leadingZero) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            if (digits == 0 && *current_ == '0') {
                leadingZero = true;
            }
            if (index >= json_detail::NumberBufSize - 1) {
                setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return false;
            }
            buf[index++] = *current_;
            ++current_;
            ++digits;
        }
        if (digits == 0) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return false;
        }
        buf[index] = '\0';

        if (!atEnd() && *current_ == '.') {
            fractional = true;
            ++current_;
            if (!skip_digits()) return false;
        }
        if (!atEnd() && (*current_ == 'e' || *current_ == 'E')) {
            fractional = true;
            ++current_;
            if (!atEnd() && (*current_ == '+' || *current_ == '-')) {
                ++current_;
            }
            if (!skip_digits()) return false;
        }
        if (!atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    constexpr bool skip_digits() {
        std::size_t n = 0;
        while (!atEnd() && *current_ >= '0' && *current_ <= '9') {
            ++current_;
            ++n;
        }
        if (n == 0) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    // buf: null-terminated, optional leading '-' then digits.
    // Returns false on overflow or '-' for unsigned types.
    template <class Int>
    static constexpr bool parse_decimal_integer(const char* buf, Int& out) noexcept {
        using Limits   = std::numeric_limits<Int>;
        using Unsigned = std::make_unsigned_t<Int>;

        const char *p = buf;
        bool negative = false;
        if (*p == '-') {
            if constexpr (!std::is_signed_v<Int>) {
                // "-0" is still zero
                for (const char * q = p + 1; *q != 0; ++q) {
                    if (*q != '0') return false;
                }
                out = 0;
                return true;
            }
            negative = true;
            ++p;
        }

        Unsigned limit;
        if constexpr (std::is_signed_v<Int>) {
            limit = negative ? Unsigned(Limits::max()) + 1u : Unsigned(Limits::max());
        } else {
            limit = std::numeric_limits<Unsigned>::max();
        }

        Unsigned value = 0;
        for (; *p != 0; ++p) {
            const unsigned digit = static_cast<unsigned>(*p - '0');
            if (value > (limit - digit) / 10u)  {
                return false;
            }
            value = static_cast<Unsigned>(value * 10u + digit);
        }

        if constexpr (std::is_signed_v<Int>) {
            if (negative) {
                if (value == Unsigned(Limits::max()) + 1u) {
                    out = Limits::min();
                } else {
                    out = static_cast<Int>(-static_cast<Int>(value));
                }
                return true;
            }
        }
        out = static_cast<Int>(value);
        return true;
    }

    JsonIteratorReaderError m_error;
    It current_;
    Sent end_;

    char        string_buf_[4]  = {};
    std::size_t string_buf_len_ = 0;
    std::size_t string_buf_pos_ = 0;
    bool        in_string_      = false;
};
static_assert(reader::ReaderLike<JsonIteratorReader<const char*, const char*>>);


enum class JsonIteratorWriterError {
    NO_ERROR,
    OUTPUT_OVERFLOW
};

constexpr std::string_view error_to_string(JsonIteratorWriterError e) {
    switch(e) {
    case JsonIteratorWriterError::NO_ERROR: return "NO_ERROR"; break;
    case JsonIteratorWriterError::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW"; break;
    }
    return "N/A";
}

template<class It, class Sent, bool Pretty = false>
class JsonIteratorWriter {
public:
    using iterator_type = It;
    struct MapFrame {
        std::size_t depth = 0;
        bool empty = true;
    };

    using error_type = JsonIteratorWriterError;

    constexpr JsonIteratorWriter(It first, Sent last, std::size_t indent_size = 2)
        : m_error(JsonIteratorWriterError::NO_ERROR), m_current(first), end_(last), m_indent_size(indent_size) {}

    constexpr JsonIteratorWriterError getError() const {
        return m_error;
    }
    constexpr It current() const {
        return m_current;
    }

    constexpr bool write_map_begin(std::size_t size, MapFrame& frame) {
        if(!put('{')) return false;
        frame.empty = size == 0;
        if constexpr (Pretty) {
            frame.depth = m_indent_level;
            m_indent_level++;
            if (!frame.empty && !write_indent()) return false;
        }
        return true;
    }

    constexpr bool advance_after_value(MapFrame&) {
        if(!put(',')) return false;
        if constexpr (Pretty) {
            if (!write_indent()) return false;
        }
        return true;
    }

    constexpr bool move_to_value(MapFrame&) {
        if(!put(':')) return false;
        if constexpr (Pretty) {
            if(!put(' ')) return false;
        }
        return true;
    }

    constexpr bool write_map_end(MapFrame& frame) {
        if constexpr (Pretty) {
            m_indent_level = frame.depth;
            if (!frame.empty && !write_indent()) return false;
        }
        return put('}');
    }

    constexpr bool write_null() {
        return serialize_literal("null");
    }
    constexpr bool write_bool(const bool & obj) {
        return serialize_literal(obj ? "true" : "false");
    }

    template<class NumberT>
    constexpr bool write_number(const NumberT & v) {
        static_assert(std::is_integral_v<NumberT> && !std::is_same_v<NumberT, bool>,
                      "[[[ EnumFusion ]]] only integral numbers are supported");
        char buf[json_detail::NumberBufSize];
        const std::size_t len = format_decimal_integer<NumberT>(v, buf);
        return serialize_literal(std::string_view(buf, len));
    }

    constexpr bool write_string_begin() {
        return put('"');
    }

    constexpr bool write_string_chunk(const char* data, std::size_t size) {
        constexpr char hex[] = "0123456789abcdef";
        for (std::size_t i = 0; i < size; ++i) {
            const auto uc = static_cast<unsigned char>(data[i]);
            bool ok = true;
            switch (uc) {
            case '"':  ok = put('\\') && put('"');  break;
            case '\\': ok = put('\\') && put('\\'); break;
            case '\b': ok = put('\\') && put('b');  break;
            case '\f': ok = put('\\') && put('f');  break;
            case '\n': ok = put('\\') && put('n');  break;
            case '\r': ok = put('\\') && put('r');  break;
            case '\t': ok = put('\\') && put('t');  break;
            default:
                if (uc < 0x20) {
                    ok = serialize_literal("\\u00") && put(hex[(uc >> 4) & 0xF]) && put(hex[uc & 0xF]);
                } else {
                    ok = put(static_cast<char>(uc));
                }
                break;
            }
            if (!ok) return false;
        }
        return true;
    }

    constexpr bool write_string_end() {
        return put('"');
    }

    constexpr bool write_string(const char* data, std::size_t size) {
        return write_string_begin() && write_string_chunk(data, size) && write_string_end();
    }

private:
    constexpr void setError(JsonIteratorWriterError e) {
        m_error = e;
    }

    constexpr bool put(char c) {
        if(m_current == end_) {
            setError(JsonIteratorWriterError::OUTPUT_OVERFLOW);
            return false;
        }
        *m_current++ = c;
        return true;
    }

    constexpr bool serialize_literal(std::string_view lit) {
        for (char c : lit) {
            if (!put(c)) return false;
        }
        return true;
    }

    constexpr bool write_indent() {
        if (!put('\n')) return false;
        for (std::size_t i = 0; i < m_indent_level * m_indent_size; ++i) {
            if (!put(' ')) return false;
        }
        return true;
    }

    // Writes base-10 representation of value into buf, returns its length.
    template <class Int>
    static constexpr std::size_t format_decimal_integer(Int value, char (&buf)[json_detail::NumberBufSize]) noexcept {
        using Unsigned = std::make_unsigned_t<Int>;
        char tmp[json_detail::NumberBufSize];
        std::size_t n = 0;
        Unsigned u;
        bool negative = false;

        if constexpr (std::is_signed_v<Int>) {
            if (value < 0) {
                negative = true;
                // min() safe in the unsigned domain
                u = Unsigned(-(value + 1)) + 1u;
            } else {
                u = static_cast<Unsigned>(value);
            }
        } else {
            u = static_cast<Unsigned>(value);
        }

        do {
            tmp[n++] = static_cast<char>('0' + static_cast<unsigned>(u % 10u));
            u /= 10u;
        } while (u != 0);

        std::size_t len = 0;
        if (negative) buf[len++] = '-';
        while (n > 0) buf[len++] = tmp[--n];
        return len;
    }

    JsonIteratorWriterError m_error;
    It m_current;
    Sent end_;
    std::size_t m_indent_level = 0;
    std::size_t m_indent_size = 2;
};

static_assert(writer::WriterLike<JsonIteratorWriter<char*, char*, false>>);
static_assert(writer::WriterLike<JsonIteratorWriter<char*, char*, true>>);

} // namespace EnumFusion
