#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>

namespace EnumFusion {

// 1) Iterator you can:
//    - read as *it   (convertible to char)
//    - advance as it++ / ++it
template <class It>
concept CharInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, char>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class It, class Sent>
concept CharSentinelFor =
    CharInputIterator<It> &&
    std::sentinel_for<Sent, It>;

template <class It>
concept CharOutputIterator =
    std::output_iterator<It, char>;

template <class Sent, class It>
concept CharSentinelForOut =
    std::sentinel_for<Sent, It>;


namespace reader {

enum class TryParseStatus {
    no_match,   // not our case, iterator unchanged
    ok,         // parsed and consumed
    error       // malformed, reader already holds the error
};

enum class StringChunkStatus {
    ok,
    no_match,   // not at a string
    error
};

struct StringChunkResult {
    StringChunkStatus status;
    std::size_t       bytes_written;
    bool              done;          // closing '"' consumed
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

/// What the EnumMap parser needs from a reader: objects, null, bool,
/// integers and chunked strings.
template<typename R>
concept ReaderLike = requires(R reader,
                              R & mutable_reader,
                              bool & bool_ref,
                              int & int_ref,
                              char * char_ptr,
                              std::size_t size,
                              typename R::MapFrame & mapFrameRef) {
    typename R::iterator_type;
    typename R::MapFrame;
    typename R::error_type;

    { reader.current() } -> std::same_as<typename R::iterator_type>;
    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<int>(int_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_string_chunk(char_ptr, size) } -> std::same_as<StringChunkResult>;

    { mutable_reader.finish() } -> std::same_as<bool>;
};

} // namespace reader


namespace writer {

template<typename W>
concept WriterLike = requires(W writer,
                              W & mutable_writer,
                              const bool & bool_ref,
                              const int & int_ref,
                              const char * char_ptr,
                              std::size_t size,
                              typename W::MapFrame & mapFrameRef) {
    typename W::iterator_type;
    typename W::MapFrame;
    typename W::error_type;

    { writer.current() } -> std::same_as<typename W::iterator_type>;
    { writer.getError() } -> std::same_as<typename W::error_type>;

    { mutable_writer.write_map_begin(size, mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<int>(int_ref) } -> std::same_as<bool>;
    { mutable_writer.write_string_begin() } -> std::same_as<bool>;
    { mutable_writer.write_string_chunk(char_ptr, size) } -> std::same_as<bool>;
    { mutable_writer.write_string_end() } -> std::same_as<bool>;
};

} // namespace writer

} // namespace EnumFusion
