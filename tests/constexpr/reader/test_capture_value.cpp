#include "../test_helpers.hpp"
#include <string>
#include <string_view>

using namespace TestHelpers;
using JsonCatchAll::JsonIteratorReaderError;

// ============================================================================
// Byte-faithful capture
// ============================================================================

static_assert(CapturesAs(R"({ "a" : [1, 2 ] })", R"({ "a" : [1, 2 ] })"), "Inner whitespace is kept");
static_assert(CapturesAs("  [1]  ", "[1]"), "Outer whitespace is not part of the fragment");
static_assert(CapturesAs(R"("a\"bé")", R"("a\"bé")"), "Escapes are kept as written");
static_assert(CapturesAs("-1.5e+3", "-1.5e+3"));
static_assert(CapturesAs("null", "null"));
static_assert(CapturesAs("true", "true"));
static_assert(CapturesAs("{}", "{}"));
static_assert(CapturesAs("[]", "[]"));
static_assert(CapturesAs(R"({"a":{"b":[{"c":null}]},"d":"}"})", R"({"a":{"b":[{"c":null}]},"d":"}"})"));

// Capture stops at the end of one value, leaving the rest to the caller
static_assert([]() constexpr {
    auto reader = MakeReader(R"([1, 2], "next")");
    std::string out;
    return reader.capture_value(out) && out == "[1, 2]" && *reader.current() == ',';
}(), "Capture consumes exactly one value");

// ============================================================================
// Malformed fragments
// ============================================================================

static_assert(CaptureFailsWith("[1,]", JsonIteratorReaderError::ILLFORMED_ARRAY));
static_assert(CaptureFailsWith("[1 2]", JsonIteratorReaderError::ILLFORMED_ARRAY));
static_assert(CaptureFailsWith(R"({"a" 1})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(CaptureFailsWith(R"({"a":1,})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(CaptureFailsWith(R"({1:2})", JsonIteratorReaderError::ILLFORMED_OBJECT));
static_assert(CaptureFailsWith(R"({"a":1)", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(CaptureFailsWith("", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(CaptureFailsWith("01", JsonIteratorReaderError::ILLFORMED_NUMBER));
static_assert(CaptureFailsWith("1.", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(CaptureFailsWith("trux", JsonIteratorReaderError::ILLFORMED_BOOL));
static_assert(CaptureFailsWith("nul", JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(CaptureFailsWith(R"("a\x")", JsonIteratorReaderError::ILLFORMED_STRING));
static_assert(CaptureFailsWith("\"a\nb\"", JsonIteratorReaderError::ILLFORMED_STRING), "Raw control characters are rejected");
static_assert(CaptureFailsWith("}", JsonIteratorReaderError::ILLFORMED_OBJECT));

// ============================================================================
// Nesting limit
// ============================================================================

static_assert(CapturesAs("[[]]", "[[]]"));
static_assert(CaptureFailsWith("[[[]]]", JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW, 2));
static_assert(!CaptureFailsWith("[[]]", JsonIteratorReaderError::SKIPPING_STACK_OVERFLOW, 2));

// ============================================================================
// Numbers of any length
// ============================================================================

static_assert(CapturesAs("1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890", "1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890"), "Integers longer than the conversion buffer");
static_assert(CapturesAs(R"({"pi": 3.14159265358979323846141592653589793238461415926535897932384614159265358979323846e-7})", R"({"pi": 3.14159265358979323846141592653589793238461415926535897932384614159265358979323846e-7})"));
static_assert(CapturesAs("[-1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890, 0]", "[-1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890, 0]"));
static_assert(CaptureFailsWith("1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890.", JsonCatchAll::JsonIteratorReaderError::UNEXPECTED_END_OF_DATA));
static_assert(CaptureFailsWith("01234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890", JsonCatchAll::JsonIteratorReaderError::ILLFORMED_NUMBER));

static_assert([]() constexpr {
    auto reader = MakeReader("[1234567890123456789012345678901234567890123456789012345678901234567890123456789012345678901234567890]");
    return reader.skip_value() && reader.finish();
}(), "skip_value has no number length limit");
