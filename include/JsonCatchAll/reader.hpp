#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#include "io.hpp"
#include "reader_concept.hpp"

namespace JsonCatchAll {

enum class JsonIteratorReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    EXCESS_CHARACTERS,
    ILLFORMED_NULL,
    ILLFORMED_BOOL,
    ILLFORMED_OBJECT,
    ILLFORMED_STRING,
    ILLFORMED_NUMBER,
    ILLFORMED_ARRAY,
    SKIPPING_STACK_OVERFLOW,
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
    case JsonIteratorReaderError::ILLFORMED_ARRAY: return "ILLFORMED_ARRAY"; break;
    case JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW: return "SKIPPING_STACK_OVERFLOW"; break;
    case JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE"; break;
    }
    return "N/A";
}

/// Pull reader over a character range.
/// Values are consumed with the typed primitives (read_bool, read_number,
/// read_string), or as opaque fragments with capture_value(), which copies
/// the exact source bytes of one JSON value.
template<CharInputIterator It, CharSentinelFor<It> Sent, std::size_t MaxSkipNesting = 64>
class JsonIteratorReader {
public:
    using iterator_type = It;
    struct ArrayFrame {};
    struct MapFrame {};

    using error_type = JsonIteratorReaderError;

    constexpr JsonIteratorReader(It first, Sent last, std::size_t maxDepth = MaxSkipNesting)
        : m_error(JsonIteratorReaderError::NO_ERROR), current_(first), m_errorPos(first), end_(last),
          m_maxDepth(maxDepth < MaxSkipNesting ? maxDepth : MaxSkipNesting) {}


    __attribute__((noinline)) constexpr reader::TryParseStatus start_value_and_try_read_null() {
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }

        if (*current_ != 'n') {
            return reader::TryParseStatus::no_match;
        }
        current_ ++;
        if (!match_literal("ull") || !atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NULL);
            return reader::TryParseStatus::error;
        }
        return reader::TryParseStatus::ok;
    }

    __attribute__((noinline)) constexpr reader::TryParseStatus read_bool(bool & b) {
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        switch(*current_) {
        case 't': {
            current_ ++;
            if (match_literal("rue") && atPlainEnd())  {
                b = true;
                return reader::TryParseStatus::ok;
            }
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        }
        case 'f': {
            current_ ++;
            if (match_literal("alse") && atPlainEnd())  {
                b = false;
                return reader::TryParseStatus::ok;
            }
            setError(JsonIteratorReaderError::ILLFORMED_BOOL);
            return reader::TryParseStatus::error;
        }
        default:
            return reader::TryParseStatus::no_match;
        }
    }

    template<class NumberT>
    __attribute__((noinline)) constexpr reader::TryParseStatus read_number(NumberT & storage) {
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        char c = *current_;
        if(c != '-' && (c < '0' || c > '9')) {
            return reader::TryParseStatus::no_match;
        }

        char buf[reader::NumberBufSize];
        std::size_t index = 0;
        bool seenDot = false;
        bool seenExp = false;

        if (!read_number_token(buf, index, seenDot, seenExp)) {
            return reader::TryParseStatus::error;
        }

        if constexpr (std::is_integral_v<NumberT>) {
            if (seenDot || seenExp) {
                setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return reader::TryParseStatus::error;
            }
            NumberT value{};
            if(!parse_decimal_integer<NumberT>(buf, value)) {
                setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return reader::TryParseStatus::error;
            }
            storage = value;
            return reader::TryParseStatus::ok;
        } else {
            static_assert(std::is_floating_point_v<NumberT>,
                          "[[[ JsonCatchAll ]]] number storage must be integral or floating point");
            double x = 0;
            auto [ptr, ec] = std::from_chars(buf, buf + index, x);
            if(ec == std::errc::result_out_of_range
                || static_cast<double>(std::numeric_limits<NumberT>::lowest()) > x
                || static_cast<double>(std::numeric_limits<NumberT>::max()) < x) {
                setError(JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return reader::TryParseStatus::error;
            }
            if(ec != std::errc{} || ptr != buf + index) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return reader::TryParseStatus::error;
            }
            storage = static_cast<NumberT>(x);
            return reader::TryParseStatus::ok;
        }
    }

    /// Reads a JSON string, unescaped, appending to `out`.
    template<class Out>
    __attribute__((noinline)) constexpr reader::TryParseStatus read_string(Out & out) {
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return reader::TryParseStatus::error;
        }
        if(*current_ != '"') {
            return reader::TryParseStatus::no_match;
        }
        ++current_;
        if(!read_string_body(out)) {
            return reader::TryParseStatus::error;
        }
        return reader::TryParseStatus::ok;
    }

    // Array/object structural events
    __attribute__((noinline)) constexpr reader::IterationStatus read_array_begin(ArrayFrame&) {
        return read_container_begin('[', ']', JsonIteratorReaderError::ILLFORMED_ARRAY);
    }
    __attribute__((noinline)) constexpr reader::IterationStatus read_map_begin(MapFrame&) {
        reader::IterationStatus ret = read_container_begin('{', '}', JsonIteratorReaderError::ILLFORMED_OBJECT);
        if(ret.status == reader::TryParseStatus::ok && ret.has_value && *current_ != '"') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            ret.status = reader::TryParseStatus::error;
        }
        return ret;
    }

    /// Reads the key the reader is positioned on (after read_map_begin or
    /// advance_after_value reported has_value).
    template<class Out>
    __attribute__((noinline)) constexpr bool read_key(Out & key) {
        key.clear();
        reader::TryParseStatus st = read_string(key);
        if(st == reader::TryParseStatus::no_match) {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
        return st == reader::TryParseStatus::ok;
    }

    __attribute__((noinline)) constexpr bool move_to_value(MapFrame&) {
        skip_whitespace();
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        if(*current_ != ':') {
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
        current_ ++;
        skip_whitespace();
        return true;
    }

    // Comma handling
    __attribute__((noinline)) constexpr reader::IterationStatus advance_after_value(ArrayFrame&) {
        return advance_in_container(']', JsonIteratorReaderError::ILLFORMED_ARRAY, false);
    }
    __attribute__((noinline)) constexpr reader::IterationStatus advance_after_value(MapFrame&) {
        return advance_in_container('}', JsonIteratorReaderError::ILLFORMED_OBJECT, true);
    }

    __attribute__((noinline)) constexpr bool skip_value() {
        NoOpFiller filler{};
        return skip_json_value_internal(filler);
    }

    /// Raw-fragment mode: validates one JSON value and appends its exact
    /// source bytes (inner whitespace included) to `out`.
    template<class Out>
    __attribute__((noinline)) constexpr bool capture_value(Out & out) {
        DynContainerFiller<Out> filler{&out};
        return skip_json_value_internal(filler);
    }

    __attribute__((noinline)) constexpr bool finish() {
        skip_whitespace();
        if (current_ != end_) {
            setError(JsonIteratorReaderError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

    constexpr It current() const { return current_; }
    constexpr It errorPos() const { return m_errorPos; }
    constexpr JsonIteratorReaderError getError() const {
        return m_error;
    }
    constexpr std::size_t maxDepth() const {
        return m_maxDepth;
    }

private:
    JsonIteratorReaderError m_error;
    It current_;
    It m_errorPos;
    Sent end_;
    std::size_t m_maxDepth;

    constexpr void setError(JsonIteratorReaderError e) {
        m_error = e;
        m_errorPos = current_;
    }

    constexpr bool atEnd() const {
        return current_ == end_;
    }

    static constexpr bool isPlainEnd(char a) {
        switch(a) {
        case ']':
        case ',':
        case '}':
        case ':':
        case 0x20:
        case 0x0A:
        case 0x0D:
        case 0x09:
            return true;
        }
        return false;
    }
    constexpr bool atPlainEnd() const {
        return atEnd() || isPlainEnd(*current_);
    }

    static constexpr bool isSpace(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }
    static constexpr bool isDigit(char c) noexcept {
        return c >= '0' && c <= '9';
    }
    static constexpr bool isHex(char c) noexcept {
        return isDigit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
    }

    constexpr void skip_whitespace() {
        while (current_ != end_ && isSpace(*current_)) {
            ++current_;
        }
    }

    constexpr bool match_literal(std::string_view lit) {
        for (char c : lit) {
            if (atEnd())  {
                return false;
            }
            if (*current_ != c)  {
                return false;
            }
            ++current_;
        }
        return true;
    }

    constexpr reader::IterationStatus read_container_begin(char open, char close, JsonIteratorReaderError err) {
        reader::IterationStatus ret;
        if(atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(*current_ != open)  {
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        }
        current_++;
        skip_whitespace();
        if(atEnd())  {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if(*current_ == ',') {
            setError(err);
            return ret;
        }
        if(*current_ == close) {
            current_++;
        } else {
            ret.has_value = true;
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    constexpr reader::IterationStatus advance_in_container(char close, JsonIteratorReaderError err, bool keyed) {
        reader::IterationStatus ret{};
        skip_whitespace();
        if (atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        if (*current_ == close) {
            ++current_;
            ret.status = reader::TryParseStatus::ok;
            return ret;
        }
        if (*current_ != ',') {
            setError(err);
            return ret;
        }
        ++current_;
        skip_whitespace();
        if (atEnd()) {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return ret;
        }
        // Trailing or doubled commas: { "a": 1, } and [1,,2]
        if (*current_ == ',' || *current_ == close || (keyed && *current_ != '"')) {
            setError(err);
            return ret;
        }
        ret.has_value = true;
        ret.status    = reader::TryParseStatus::ok;
        return ret;
    }

    // Validates one RFC 8259 number, handing every consumed byte to `sink`.
    // `sink(c)` returns false to abort (its error already set).
    template<class Sink>
    constexpr bool scan_number_token(Sink&& sink, bool& seenDot, bool& seenExp) {
        seenDot = false;
        seenExp = false;

        auto push_char = [&](char c) -> bool {
            if (!sink(c)) return false;
            ++current_;
            return true;
        };
        auto digits = [&]() -> bool {
            if (atEnd() || !isDigit(*current_)) {
                setError(atEnd() ? JsonIteratorReaderError::UNEXPECTED_END_OF_DATA
                                 : JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            while (!atEnd() && isDigit(*current_)) {
                if (!push_char(*current_)) return false;
            }
            return true;
        };

        if (!atEnd() && *current_ == '-') {
            if (!push_char('-')) return false;
        }
        if (atEnd())   {
            setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        // RFC 8259: no leading zeros
        if (*current_ == '0') {
            if (!push_char('0')) return false;
            if (!atEnd() && isDigit(*current_)) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
        } else if (!digits()) {
            return false;
        }
        if (!atEnd() && *current_ == '.') {
            seenDot = true;
            if (!push_char('.') || !digits()) return false;
        }
        if (!atEnd() && (*current_ == 'e' || *current_ == 'E')) {
            seenExp = true;
            if (!push_char(*current_)) return false;
            if (!atEnd() && (*current_ == '+' || *current_ == '-')) {
                if (!push_char(*current_)) return false;
            }
            if (!digits()) return false;
        }
        if (!atPlainEnd()) {
            setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
            return false;
        }
        return true;
    }

    // Typed numbers are converted from a bounded, null-terminated copy
    constexpr bool read_number_token(char (&buf)[reader::NumberBufSize],
                                     std::size_t& index,
                                     bool& seenDot,
                                     bool& seenExp)
    {
        index = 0;
        auto toBuffer = [&](char c) -> bool {
            if (index >= reader::NumberBufSize - 1) {
                setError(JsonIteratorReaderError::ILLFORMED_NUMBER);
                return false;
            }
            buf[index++] = c;
            return true;
        };
        if (!scan_number_token(toBuffer, seenDot, seenExp)) {
            return false;
        }
        buf[index] = '\0';
        return true;
    }

    // buf: null-terminated ASCII, optional leading '-' then digits.
    // Returns false on overflow or '-' for unsigned types.
    template <class Int>
    constexpr bool parse_decimal_integer(const char* buf, Int& out) noexcept {
        using Limits   = std::numeric_limits<Int>;
        using Unsigned = std::make_unsigned_t<Int>;

        const char *p = buf;
        bool negative = false;
        if (*p == '-') {
            if constexpr (!std::is_signed_v<Int>) {
                return false;
            }
            negative = true;
            ++p;
        }

        Unsigned limit;
        if constexpr (std::is_signed_v<Int>) {
            limit = negative ? Unsigned(Limits::max()) + 1u
                             : Unsigned(Limits::max());
        } else {
            limit = std::numeric_limits<Unsigned>::max();
        }

        Unsigned value = 0;
        for (; *p != 0; ++p) {
            unsigned digit = static_cast<unsigned>(*p - '0');
            if (value > (limit - digit) / 10u)  {
                return false;
            }
            value = value * 10u + static_cast<Unsigned>(digit);
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

    constexpr bool readHex4(std::uint16_t &out) {
        out = 0;
        for (int i = 0; i < 4; ++i) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char currChar = *current_;
            std::uint8_t v;
            if (isDigit(currChar)) {
                v = static_cast<std::uint8_t>(currChar - '0');
            } else if (currChar >= 'A' && currChar <= 'F') {
                v = static_cast<std::uint8_t>(currChar - 'A' + 10);
            } else if (currChar >= 'a' && currChar <= 'f') {
                v = static_cast<std::uint8_t>(currChar - 'a' + 10);
            } else  {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            out = static_cast<std::uint16_t>((out << 4) | v);
            ++current_;
        }
        return true;
    }

    template<class Out>
    static constexpr void append_utf8(Out & out, std::uint32_t codepoint) {
        if (codepoint <= 0x7Fu) {
            out.push_back(static_cast<char>(codepoint));
        } else if (codepoint <= 0x7FFu) {
            out.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else if (codepoint <= 0xFFFFu) {
            out.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
        }
    }

    // Opening quote already consumed.
    template<class Out>
    constexpr bool read_string_body(Out & out) {
        while (true) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char c = *current_;
            if (c == '"') {
                ++current_;
                return true;
            }
            if (static_cast<unsigned char>(c) <= 0x1F) {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            if (c != '\\') {
                out.push_back(c);
                ++current_;
                continue;
            }

            ++current_;
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char esc = *current_;
            ++current_;
            switch (esc) {
            case '"':  out.push_back('"');  continue;
            case '/':  out.push_back('/');  continue;
            case '\\': out.push_back('\\'); continue;
            case 'b':  out.push_back('\b'); continue;
            case 'f':  out.push_back('\f'); continue;
            case 'r':  out.push_back('\r'); continue;
            case 'n':  out.push_back('\n'); continue;
            case 't':  out.push_back('\t'); continue;
            case 'u':  break;
            default:
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }

            std::uint16_t u1 = 0;
            if (!readHex4(u1)) {
                return false;
            }
            std::uint32_t codepoint = u1;
            if (u1 >= 0xD800u && u1 <= 0xDBFFu) {
                // High surrogate, a low one must follow
                if (!match_literal("\\u")) {
                    setError(JsonIteratorReaderError::ILLFORMED_STRING);
                    return false;
                }
                std::uint16_t u2 = 0;
                if (!readHex4(u2)) {
                    return false;
                }
                if (u2 < 0xDC00u || u2 > 0xDFFFu) {
                    setError(JsonIteratorReaderError::ILLFORMED_STRING);
                    return false;
                }
                codepoint = 0x10000u
                            + ((static_cast<std::uint32_t>(u1) - 0xD800u) << 10)
                            + (static_cast<std::uint32_t>(u2) - 0xDC00u);
            } else if (u1 >= 0xDC00u && u1 <= 0xDFFFu) {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            append_utf8(out, codepoint);
        }
    }

    template<class Cont>
    struct DynContainerFiller {
        Cont * out;
        constexpr void operator()(char ch) {
            out->push_back(ch);
        }
    };
    struct NoOpFiller {
        constexpr void operator()(char) {}
    };

    // Copies a raw JSON string (escapes kept) through the filler, validating it.
    template<class Filler>
    constexpr bool skip_string_raw_via_filler(Filler& f) {
        f('"');
        ++current_;
        while (true) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char c = *current_;
            if (c == '"') {
                f('"');
                ++current_;
                return true;
            }
            if (static_cast<unsigned char>(c) <= 0x1F) {
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
            f(c);
            ++current_;
            if (c != '\\') {
                continue;
            }
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            char esc = *current_;
            switch (esc) {
            case '"': case '/': case '\\': case 'b':
            case 'f': case 'r': case 'n': case 't':
                f(esc);
                ++current_;
                break;
            case 'u': {
                f(esc);
                ++current_;
                for (int i = 0; i < 4; ++i) {
                    if (atEnd()) {
                        setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                        return false;
                    }
                    if (!isHex(*current_)) {
                        setError(JsonIteratorReaderError::ILLFORMED_STRING);
                        return false;
                    }
                    f(*current_);
                    ++current_;
                }
                break;
            }
            default:
                setError(JsonIteratorReaderError::ILLFORMED_STRING);
                return false;
            }
        }
    }

    template<class Filler>
    constexpr bool skip_number_via_filler(Filler& f) {
        // No length limit: skipped and captured numbers are never converted
        bool seenDot = false;
        bool seenExp = false;
        return scan_number_token([&](char c) {
            f(c);
            return true;
        }, seenDot, seenExp);
    }

    template<class Filler>
    constexpr bool skip_literal_via_filler(Filler& f, std::string_view lit, JsonIteratorReaderError err) {
        for (char c : lit) {
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            if (*current_ != c) {
                setError(err);
                return false;
            }
            f(c);
            ++current_;
        }
        if (!atPlainEnd()) {
            setError(err);
            return false;
        }
        return true;
    }

    template<class Filler>
    constexpr bool skip_scalar_via_filler(Filler& f) {
        switch (*current_) {
        case '"': return skip_string_raw_via_filler(f);
        case 't': return skip_literal_via_filler(f, "true", JsonIteratorReaderError::ILLFORMED_BOOL);
        case 'f': return skip_literal_via_filler(f, "false", JsonIteratorReaderError::ILLFORMED_BOOL);
        case 'n': return skip_literal_via_filler(f, "null", JsonIteratorReaderError::ILLFORMED_NULL);
        default:
            if (*current_ == '-' || isDigit(*current_)) {
                return skip_number_via_filler(f);
            }
            setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
            return false;
        }
    }

    // Walks exactly one JSON value with an explicit stack instead of recursion,
    // validating structure and mirroring every consumed byte to the filler.
    template <class Filler>
    constexpr bool skip_json_value_internal(Filler &filler) {
        enum class Expect { Value, ValueOrClose, Key, KeyOrClose, Colon, CommaOrClose };

        skip_whitespace();

        char stack[MaxSkipNesting];
        std::size_t depth = 0;
        Expect expect = Expect::Value;

        while (true) {
            if (depth > 0) {
                while (!atEnd() && isSpace(*current_)) {
                    filler(*current_);
                    ++current_;
                }
            }
            if (atEnd()) {
                setError(JsonIteratorReaderError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            const char c = *current_;
            bool valueDone = false;

            switch (expect) {
            case Expect::ValueOrClose:
                if (c == ']') {
                    --depth;
                    filler(c);
                    ++current_;
                    valueDone = true;
                    break;
                }
                [[fallthrough]];
            case Expect::Value:
                if (c == '{' || c == '[') {
                    if (depth >= m_maxDepth) {
                        setError(JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW);
                        return false;
                    }
                    stack[depth++] = c;
                    filler(c);
                    ++current_;
                    expect = c == '{' ? Expect::KeyOrClose : Expect::ValueOrClose;
                    break;
                }
                if (c == ']' || c == '}' || c == ',' || c == ':') {
                    setError(depth > 0 && stack[depth - 1] == '['
                                 ? JsonIteratorReaderError::ILLFORMED_ARRAY
                                 : JsonIteratorReaderError::ILLFORMED_OBJECT);
                    return false;
                }
                if (!skip_scalar_via_filler(filler)) {
                    return false;
                }
                valueDone = true;
                break;
            case Expect::KeyOrClose:
                if (c == '}') {
                    --depth;
                    filler(c);
                    ++current_;
                    valueDone = true;
                    break;
                }
                [[fallthrough]];
            case Expect::Key:
                if (c != '"') {
                    setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
                    return false;
                }
                if (!skip_string_raw_via_filler(filler)) {
                    return false;
                }
                expect = Expect::Colon;
                break;
            case Expect::Colon:
                if (c != ':') {
                    setError(JsonIteratorReaderError::ILLFORMED_OBJECT);
                    return false;
                }
                filler(c);
                ++current_;
                expect = Expect::Value;
                break;
            case Expect::CommaOrClose: {
                const bool inObject = stack[depth - 1] == '{';
                if (c == ',') {
                    filler(c);
                    ++current_;
                    expect = inObject ? Expect::Key : Expect::Value;
                    break;
                }
                if (c == (inObject ? '}' : ']')) {
                    --depth;
                    filler(c);
                    ++current_;
                    valueDone = true;
                    break;
                }
                setError(inObject ? JsonIteratorReaderError::ILLFORMED_OBJECT
                                  : JsonIteratorReaderError::ILLFORMED_ARRAY);
                return false;
            }
            }

            if (valueDone) {
                if (depth == 0) {
                    return true;
                }
                expect = Expect::CommaOrClose;
            }
        }
    }
};

} // namespace JsonCatchAll
