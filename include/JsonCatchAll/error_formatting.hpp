#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "parse_result.hpp"

namespace JsonCatchAll {

namespace error_formatting_detail {

inline std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\n\r\f\v";
    std::size_t b = s.find_first_not_of(ws);
    if(b == std::string_view::npos) {
        return {};
    }
    std::size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

}

/// Human readable description of a failed parse, with up to `window` bytes
/// of input on each side of the failure point.
inline std::string ParseResultToString(const ParseResult & res, std::string_view input, std::size_t window = 40) {
    if(res) {
        return "OK";
    }
    std::size_t pos = res.offset() < input.size() ? res.offset() : input.size();
    std::size_t from = pos >= window ? pos - window : 0;
    std::string_view before = error_formatting_detail::trim(input.substr(from, pos - from));
    std::string_view after = error_formatting_detail::trim(input.substr(pos, window));

    std::string reader;
    if(res.readerError() != JsonIteratorReaderError::NO_ERROR) {
        reader = fmt::format(" (reader: '{}')", error_to_string(res.readerError()));
    }
    return fmt::format("At offset {}, parsing error '{}'{}: '...{}<<here>>{}...'",
                       pos, error_to_string(res.error()), reader, before, after);
}

inline std::string SerializeResultToString(const SerializeResult & res) {
    if(res) {
        return "OK";
    }
    return fmt::format("Serialization error '{}' (writer: '{}')",
                       error_to_string(res.error()), error_to_string(res.writerError()));
}

} // namespace JsonCatchAll
