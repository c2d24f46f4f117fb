#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "enum_map.hpp"
#include "errors.hpp"
#include "io.hpp"
#include "json.hpp"
#include "key_name.hpp"
#include "value_model.hpp"

namespace EnumFusion {

template <CharOutputIterator OutIter, class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;
public:
    constexpr SerializeResult(SerializeError err, WriterError werr, OutIter pos):
        m_error(err), m_writerError(werr), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
};


namespace serializer_details {

template <CharOutputIterator OutIter, class WriterError>
class SerializationContext {
    SerializeError error = SerializeError::NO_ERROR;
    WriterError writerError{};
    OutIter m_pos;

public:
    constexpr SerializationContext(OutIter it): m_pos(it) {}

    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        error = SerializeError::WRITER_ERROR;
        writerError = writer.getError();
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr void finish(Writer & writer) {
        m_pos = writer.current();
    }

    constexpr SerializeResult<OutIter, WriterError> result() const {
        return SerializeResult<OutIter, WriterError>(error, writerError, m_pos);
    }
};


template<class K, writer::WriterLike Writer>
constexpr bool WriteKeyString(const K & key, Writer & writer) {
    if(!writer.write_string_begin()) {
        return false;
    }
    bool ok = true;
    auto sink = [&](std::string_view piece) {
        if(ok) {
            ok = writer.write_string_chunk(piece.data(), piece.size());
        }
    };
    key_text::write(key, sink);
    return ok && writer.write_string_end();
}

template <JsonValue V, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const V & obj, Writer & writer, CTX & ctx);

template <class K, class V, writer::WriterLike Writer, class CTX>
constexpr bool SerializeMap(const EnumMap<K, V> & map, Writer & writer, CTX & ctx) {
    typename Writer::MapFrame frame;
    if(!writer.write_map_begin(EnumMap<K, V>::Length, frame)) {
        return ctx.withWriterError(writer);
    }
    bool first = true;
    for (auto && [key, value] : map) {
        if(!first && !writer.advance_after_value(frame)) {
            return ctx.withWriterError(writer);
        }
        first = false;
        if(!WriteKeyString(key, writer) || !writer.move_to_value(frame)) {
            return ctx.withWriterError(writer);
        }
        if(!SerializeValue(value, writer, ctx)) {
            return false;
        }
    }
    if(!writer.write_map_end(frame)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <JsonValue V, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const V & obj, Writer & writer, CTX & ctx) {
    using value_model::ValueKind;
    constexpr ValueKind kind = value_model::value_kind_v<V>;

    bool ok = true;
    if constexpr (kind == ValueKind::boolean) {
        ok = writer.write_bool(obj);
    } else if constexpr (kind == ValueKind::number) {
        ok = writer.write_number(obj);
    } else if constexpr (kind == ValueKind::string) {
        ok = writer.write_string_begin() && writer.write_string_chunk(obj.data(), obj.size()) && writer.write_string_end();
    } else if constexpr (kind == ValueKind::nullable) {
        if(!obj.has_value()) {
            ok = writer.write_null();
        } else {
            return SerializeValue(*obj, writer, ctx);
        }
    } else if constexpr (kind == ValueKind::object) {
        return SerializeMap(obj, writer, ctx);
    } else {
        ok = WriteKeyString(obj, writer);
    }
    if(!ok) {
        return ctx.withWriterError(writer);
    }
    return true;
}

} // namespace serializer_details


template <JsonEnumMap MapT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const MapT & map, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type, typename Writer::error_type> ctx(writer.current());
    if(serializer_details::SerializeMap(map, writer, ctx)) {
        ctx.finish(writer);
    }
    return ctx.result();
}

/// Writes map as one JSON object, members in ascending key index order,
/// member names in the textual key form. begin is advanced past the output.
template <JsonEnumMap MapT, CharOutputIterator It, CharSentinelForOut<It> Sent, class Writer = JsonIteratorWriter<It, Sent>>
constexpr SerializeResult<It, typename Writer::error_type> Serialize(const MapT & map, It & begin, const Sent & end) {
    Writer writer(begin, end);
    auto res = SerializeWithWriter(map, writer);
    begin = writer.current();
    return res;
}

template <JsonEnumMap MapT, CharOutputIterator It, CharSentinelForOut<It> Sent>
constexpr auto SerializePretty(const MapT & map, It & begin, const Sent & end) {
    return Serialize<MapT, It, Sent, JsonIteratorWriter<It, Sent, true>>(map, begin, end);
}


namespace io_details {

struct limitless_sentinel {};

constexpr bool operator==(const std::back_insert_iterator<std::string>&,
                          const limitless_sentinel&) noexcept {
    return false;
}

} // namespace io_details

template<JsonEnumMap MapT>
constexpr auto Serialize(const MapT & map, std::string & out) {
    out.clear();
    auto it = std::back_inserter(out);
    io_details::limitless_sentinel end{};
    return Serialize(map, it, end);
}

template<JsonEnumMap MapT>
constexpr auto SerializePretty(const MapT & map, std::string & out) {
    out.clear();
    auto it = std::back_inserter(out);
    io_details::limitless_sentinel end{};
    return SerializePretty(map, it, end);
}


template <class T>
    requires (!JsonEnumMap<T>)
constexpr auto Serialize(const T &, auto &) {
    static_assert(value_model::detail::always_false<T>::value,
                  "[[[ EnumFusion ]]] Serialize expects an EnumMap whose keys have a textual form "
                  "and whose values are bool, integers, std::string, std::optional, EnumMap or key types");
}

} // namespace EnumFusion
