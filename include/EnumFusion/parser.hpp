#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "enum_map.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "json.hpp"
#include "key_name.hpp"
#include "value_model.hpp"

namespace EnumFusion {

template <class InpIter, class ReaderError>
class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    ReaderError m_readerError{};
    InpIter m_pos;

public:
    using iterator_type = InpIter;
    constexpr ParseResult(ParseError err, ReaderError rerr, InpIter pos):
        m_error(err), m_readerError(rerr), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    constexpr InpIter pos() const {
        return m_pos;
    }
    constexpr ParseError error() const {
        return m_error;
    }
    constexpr ReaderError readerError() const {
        return m_readerError;
    }
};


namespace parser_details {

template <class InpIter, class ReaderError>
class DeserializationContext {
    ReaderError reader_error = {};
    ParseError error = ParseError::NO_ERROR;
    InpIter m_pos{};

public:
    constexpr bool withParseError(ParseError err, const reader::ReaderLike auto & reader) {
        error = err;
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    constexpr bool withReaderError(const reader::ReaderLike auto & reader) {
        error = ParseError::READER_ERROR;
        reader_error = reader.getError();
        m_pos = reader.current();
        return false;
    }

    constexpr void finish(const reader::ReaderLike auto & reader) {
        m_pos = reader.current();
    }

    constexpr ParseError currentError() const { return error; }

    constexpr ParseResult<InpIter, ReaderError> result() const {
        return ParseResult<InpIter, ReaderError>(error, reader_error, m_pos);
    }
};


constexpr std::size_t STRING_CHUNK_SIZE = 64;

// Reads a whole JSON string into out. Returns no_match if the reader is not
// positioned at a string.
template<reader::ReaderLike Reader>
constexpr reader::TryParseStatus read_json_string_into(Reader & reader, std::string & out) {
    out.clear();
    std::size_t total = 0;
    while (true) {
        out.resize(total + STRING_CHUNK_SIZE);
        const reader::StringChunkResult res = reader.read_string_chunk(out.data() + total, STRING_CHUNK_SIZE);
        if (res.status == reader::StringChunkStatus::no_match) {
            out.clear();
            return reader::TryParseStatus::no_match;
        }
        if (res.status == reader::StringChunkStatus::error) {
            return reader::TryParseStatus::error;
        }
        total += res.bytes_written;
        if (res.done) {
            out.resize(total);
            return reader::TryParseStatus::ok;
        }
    }
}

template <JsonValue V, reader::ReaderLike Reader, class CTX>
constexpr bool ParseValue(V & value, Reader & reader, CTX & ctx);

/// Members are staged per index; a key seen twice keeps its last value.
/// `out` is assigned only once every key has been seen.
template <class K, class V, reader::ReaderLike Reader, class CTX>
constexpr bool ParseMap(EnumMap<K, V> & out, Reader & reader, CTX & ctx) {
    typename Reader::MapFrame frame;
    reader::IterationStatus iterStatus = reader.read_map_begin(frame);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_ENUM_MAP, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    EnumMap<K, std::optional<V>> staging;
    std::string keyText;

    while(iterStatus.has_value) {
        if(read_json_string_into(reader, keyText) != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
        const std::optional<K> key = key_text::parse<K>(keyText);
        if(!key) {
            return ctx.withParseError(ParseError::UNKNOWN_KEY, reader);
        }
        if(!reader.move_to_value(frame)) {
            return ctx.withReaderError(reader);
        }

        V value{};
        if(!ParseValue(value, reader, ctx)) {
            return false;
        }
        staging[*key] = std::move(value);

        iterStatus = reader.advance_after_value(frame);
        if(iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    for(const std::optional<V> & slot : staging.values()) {
        if(!slot.has_value()) {
            return ctx.withParseError(ParseError::KEY_NOT_SPECIFIED, reader);
        }
    }
    out = std::move(staging).map([](const K &, std::optional<V> && slot) -> V {
        return std::move(*slot);
    });
    return true;
}

template <JsonValue V, reader::ReaderLike Reader, class CTX>
constexpr bool ParseValue(V & value, Reader & reader, CTX & ctx) {
    using value_model::ValueKind;
    constexpr ValueKind kind = value_model::value_kind_v<V>;

    if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
        if constexpr (kind == ValueKind::nullable) {
            value.reset();
            return true;
        } else {
            return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        }
    } else if(r == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    if constexpr (kind == ValueKind::boolean) {
        if(reader::TryParseStatus st = reader.read_bool(value); st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if(st == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE, reader);
        }
        return true;
    } else if constexpr (kind == ValueKind::number) {
        if(reader::TryParseStatus st = reader.template read_number<V>(value); st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if(st == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, reader);
        }
        return true;
    } else if constexpr (kind == ValueKind::string) {
        if(reader::TryParseStatus st = read_json_string_into(reader, value); st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if(st == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
        }
        return true;
    } else if constexpr (kind == ValueKind::nullable) {
        value.emplace();
        return ParseValue(*value, reader, ctx);
    } else if constexpr (kind == ValueKind::object) {
        return ParseMap(value, reader, ctx);
    } else {
        std::string text;
        if(reader::TryParseStatus st = read_json_string_into(reader, text); st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else if(st == reader::TryParseStatus::no_match) {
            return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
        }
        std::optional<V> parsed = key_text::parse<V>(text);
        if(!parsed) {
            return ctx.withParseError(ParseError::ILLFORMED_KEY_VALUE, reader);
        }
        value = std::move(*parsed);
        return true;
    }
}

} // namespace parser_details


template <JsonEnumMap MapT, reader::ReaderLike Reader>
constexpr auto ParseWithReader(MapT & map, Reader & reader) {
    using CtxT = parser_details::DeserializationContext<typename Reader::iterator_type, typename Reader::error_type>;
    CtxT ctx;

    MapT parsed;
    if(parser_details::ParseMap(parsed, reader, ctx)) {
        if(!reader.finish()) {
            ctx.withReaderError(reader);
        } else {
            ctx.finish(reader);
            map = std::move(parsed);
        }
    }
    return ctx.result();
}

/// Fills map from a JSON object. Keys may come in any order; every key must
/// appear at least once. On any error map keeps its previous contents.
template <JsonEnumMap MapT, CharInputIterator It, CharSentinelFor<It> Sent, class Reader = JsonIteratorReader<It, Sent>>
constexpr auto Parse(MapT & map, It begin, const Sent & end) {
    Reader reader(begin, end);
    return ParseWithReader(map, reader);
}

template<JsonEnumMap MapT>
constexpr auto Parse(MapT & map, std::string_view sv) {
    return Parse(map, sv.data(), sv.data() + sv.size());
}

template<JsonEnumMap MapT, class ContainerT>
    requires (!std::is_pointer_v<ContainerT>) && (!std::is_convertible_v<const ContainerT &, std::string_view>)
          && requires(const ContainerT & c) { c.begin(); c.end(); }
constexpr auto Parse(MapT & map, const ContainerT & c) {
    return Parse(map, c.begin(), c.end());
}


template <class T>
    requires (!JsonEnumMap<T>)
constexpr auto Parse(T &, auto) {
    static_assert(value_model::detail::always_false<T>::value,
                  "[[[ EnumFusion ]]] Parse expects an EnumMap whose keys have a textual form "
                  "and whose values are bool, integers, std::string, std::optional, EnumMap or key types");
}

} // namespace EnumFusion
