#pragma once

#include <concepts>
#include <cstddef>
#include <string>

namespace JsonCatchAll {

namespace reader {
enum class TryParseStatus {
    no_match,   // not our case, iterator unchanged
    ok,         // parsed and consumed
    error       // malformed, reader already has error
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

constexpr std::size_t NumberBufSize = 64;


/// Interface the struct and value codecs drive. Any reader satisfying it can
/// stand in for JsonIteratorReader (e.g. one over a memory-mapped file).
template<typename R>
concept ReaderLike = requires(R reader,
                              R& mutable_reader,
                              bool& bool_ref,
                              int& int_ref,
                              double& double_ref,
                              std::string& string_ref,
                              typename R::ArrayFrame & arrFrameRef,
                              typename R::MapFrame & mapFrameRef
                              ) {
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    { reader.current() } -> std::same_as<typename R::iterator_type>;
    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_reader.read_key(string_ref) } -> std::same_as<bool>;

    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<int>(int_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<double>(double_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_string(string_ref) } -> std::same_as<TryParseStatus>;

    { mutable_reader.finish() } -> std::same_as<bool>;
    { mutable_reader.skip_value() } -> std::same_as<bool>;
    // Raw-fragment mode: exact bytes of the next value
    { mutable_reader.capture_value(string_ref) } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_reader_like_v = ReaderLike<R>;

} // namespace reader

} // namespace JsonCatchAll
