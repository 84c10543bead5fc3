#pragma once

#include <charconv>
#include <cmath>
#include <cstddef>
#include <string_view>
#include <type_traits>

#include "io.hpp"
#include "writer_concept.hpp"

namespace JsonCatchAll {

enum class JsonIteratorWriterError {
    NO_ERROR,
    OUTPUT_OVERFLOW,
    NON_FINITE_NUMBER
};

constexpr std::string_view error_to_string(JsonIteratorWriterError e) {
    switch(e) {
    case JsonIteratorWriterError::NO_ERROR: return "NO_ERROR"; break;
    case JsonIteratorWriterError::OUTPUT_OVERFLOW: return "OUTPUT_OVERFLOW"; break;
    case JsonIteratorWriterError::NON_FINITE_NUMBER: return "NON_FINITE_NUMBER"; break;
    }
    return "N/A";
}

namespace writer {
constexpr std::size_t NumberBufSize = 64;
}

/// Compact JSON writer over an output iterator.
/// With `escapeHtml` set, '<', '>' and '&' inside strings are written as
/// \u003c, \u003e and \u0026.
template<CharOutputIterator It, CharSentinelForOut<It> Sent>
class JsonIteratorWriter {
public:
    using iterator_type = It;
    struct ArrayFrame {};
    struct MapFrame {};

    using error_type = JsonIteratorWriterError;

    constexpr JsonIteratorWriter(It first, Sent last, bool escapeHtml = true)
        : m_error(JsonIteratorWriterError::NO_ERROR), m_current(first), end_(last), m_escapeHtml(escapeHtml) {}

    constexpr JsonIteratorWriterError getError() const {
        return m_error;
    }
    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }
    constexpr It current() const {
        return m_current;
    }

    constexpr bool write_array_begin(ArrayFrame&) {
        return put('[');
    }
    constexpr bool write_map_begin(MapFrame&) {
        return put('{');
    }
    constexpr bool write_array_end(ArrayFrame&) {
        return put(']');
    }
    constexpr bool write_map_end(MapFrame&) {
        return put('}');
    }
    constexpr bool advance_after_value(ArrayFrame&) {
        return put(',');
    }
    constexpr bool advance_after_value(MapFrame&) {
        return put(',');
    }
    constexpr bool move_to_value(MapFrame&) {
        return put(':');
    }
    constexpr bool write_key(std::string_view key) {
        return write_string(key);
    }

    constexpr bool write_null() {
        return write_raw("null");
    }
    constexpr bool write_bool(const bool & obj) {
        return write_raw(obj ? std::string_view("true") : std::string_view("false"));
    }

    template<class NumberT>
    __attribute__((noinline)) constexpr bool write_number(const NumberT & v) {
        char buf[writer::NumberBufSize];
        if constexpr (std::is_floating_point_v<NumberT>) {
            if(std::isnan(v) || std::isinf(v)) {
                m_error = JsonIteratorWriterError::NON_FINITE_NUMBER;
                return false;
            }
        }
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        if(ec != std::errc{}) {
            m_error = JsonIteratorWriterError::OUTPUT_OVERFLOW;
            return false;
        }
        return write_raw(std::string_view(buf, static_cast<std::size_t>(ptr - buf)));
    }

    __attribute__((noinline)) constexpr bool write_string(std::string_view s) {
        constexpr char hex[] = "0123456789abcdef";
        if(!put('"')) return false;
        for(char ch : s) {
            const unsigned char c = static_cast<unsigned char>(ch);
            switch(ch) {
            case '"':  if(!put('\\') || !put('"')) return false; continue;
            case '\\': if(!put('\\') || !put('\\')) return false; continue;
            case '\b': if(!put('\\') || !put('b')) return false; continue;
            case '\f': if(!put('\\') || !put('f')) return false; continue;
            case '\n': if(!put('\\') || !put('n')) return false; continue;
            case '\r': if(!put('\\') || !put('r')) return false; continue;
            case '\t': if(!put('\\') || !put('t')) return false; continue;
            case '<':
            case '>':
            case '&':
                if(!m_escapeHtml) break;
                if(!write_raw("\\u00") || !put(hex[c >> 4]) || !put(hex[c & 0xF])) return false;
                continue;
            default:
                break;
            }
            if(c < 0x20) {
                if(!write_raw("\\u00") || !put(hex[c >> 4]) || !put(hex[c & 0xF])) return false;
                continue;
            }
            if(!put(ch)) return false;
        }
        return put('"');
    }

    /// Copies bytes verbatim; the caller guarantees they form valid JSON.
    constexpr bool write_raw(std::string_view bytes) {
        for(char c : bytes) {
            if(!put(c)) return false;
        }
        return true;
    }

private:
    JsonIteratorWriterError m_error;
    It m_current;
    Sent end_;
    std::size_t m_bytesWritten = 0;
    bool m_escapeHtml;

    constexpr bool put(char c) {
        if(m_current == end_) {
            m_error = JsonIteratorWriterError::OUTPUT_OVERFLOW;
            return false;
        }
        *m_current = c;
        ++m_current;
        ++m_bytesWritten;
        return true;
    }
};

} // namespace JsonCatchAll
