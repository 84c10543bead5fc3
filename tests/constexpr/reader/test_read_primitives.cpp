#include "../test_helpers.hpp"
#include <cstdint>
#include <limits>
#include <string_view>

using namespace TestHelpers;
using JsonCatchAll::JsonIteratorReaderError;
using JsonCatchAll::reader::TryParseStatus;

// ============================================================================
// Strings
// ============================================================================

static_assert(ReadsString(R"("plain")", "plain"));
static_assert(ReadsString(R"("")", ""));
static_assert(ReadsString(R"("a\nb\t\"\\\/")", "a\nb\t\"\\/"));
static_assert(ReadsString(R"("\u00e9")", "\xC3\xA9"), "Two-byte UTF-8");
static_assert(ReadsString(R"("\u20AC")", "\xE2\x82\xAC"), "Three-byte UTF-8");
static_assert(ReadsString(R"("\ud83d\ude00")", "\xF0\x9F\x98\x80"), "Surrogate pair");
static_assert(ReadsString("\"\xC3\xA9\"", "\xC3\xA9"), "Raw UTF-8 passes through");

static_assert(ReadStringFailsWith(R"("\udc00")", JsonIteratorReaderError::ILLFORMED_STRING), "Lone low surrogate");
static_assert(ReadStringFailsWith(R"("\ud83d")", JsonIteratorReaderError::ILLFORMED_STRING), "High surrogate without pair");
static_assert(ReadStringFailsWith(R"("\u12g4")", JsonIteratorReaderError::ILLFORMED_STRING));
static_assert(ReadStringFailsWith(R"("abc)", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));

static_assert([]() constexpr {
    auto reader = MakeReader("123");
    std::string out;
    return reader.read_string(out) == TryParseStatus::no_match;
}(), "Non-string is not a match");

// ============================================================================
// Numbers
// ============================================================================

static_assert(ReadsNumber<int>("123", 123));
static_assert(ReadsNumber<int>("-0", 0));
static_assert(ReadsNumber<std::int64_t>("-9223372036854775808", std::numeric_limits<std::int64_t>::min()));
static_assert(ReadsNumber<std::uint64_t>("18446744073709551615", std::numeric_limits<std::uint64_t>::max()));
static_assert(ReadsNumber<std::uint8_t>("255", 255));

static_assert(ReadNumberFailsWith<std::uint8_t>("256", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(ReadNumberFailsWith<unsigned>("-1", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(ReadNumberFailsWith<int>("1.5", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(ReadNumberFailsWith<int>("1e3", JsonIteratorReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(ReadNumberFailsWith<int>("012", JsonIteratorReaderError::ILLFORMED_NUMBER));
static_assert(ReadNumberFailsWith<int>("-", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(ReadNumberFailsWith<int>("12a", JsonIteratorReaderError::ILLFORMED_NUMBER));
// Typed conversion still goes through a bounded buffer
static_assert(ReadNumberFailsWith<std::uint64_t>("1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890", JsonIteratorReaderError::ILLFORMED_NUMBER));

// ============================================================================
// Literals
// ============================================================================

static_assert([]() constexpr {
    auto reader = MakeReader("  null ");
    return reader.start_value_and_try_read_null() == TryParseStatus::ok && reader.finish();
}());

static_assert([]() constexpr {
    auto reader = MakeReader("nulls");
    return reader.start_value_and_try_read_null() == TryParseStatus::error
        && reader.getError() == JsonIteratorReaderError::ILLFORMED_NULL;
}());

static_assert([]() constexpr {
    auto reader = MakeReader("false");
    bool b = true;
    return reader.read_bool(b) == TryParseStatus::ok && !b && reader.finish();
}());

static_assert([]() constexpr {
    auto reader = MakeReader("1 2");
    int v = 0;
    return reader.read_number(v) == TryParseStatus::ok
        && !reader.finish()
        && reader.getError() == JsonIteratorReaderError::EXCESS_CHARACTERS;
}(), "Trailing data after the value");
