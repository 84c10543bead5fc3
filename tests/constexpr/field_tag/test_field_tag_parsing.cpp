#include <JsonCatchAll/field_tag.hpp>
#include <string_view>

using namespace JsonCatchAll;

// ============================================================================
// Names
// ============================================================================

static_assert(parseFieldTag("name", "Member").name == "name");
static_assert(parseFieldTag("", "Member").name == "Member", "Empty tag keeps the member name");
static_assert(parseFieldTag(",omitempty", "Member").name == "Member", "Empty name part keeps the member name");
static_assert(parseFieldTag("*", "Extra").wildcard());
static_assert(!parseFieldTag("*x", "Extra").wildcard());

// ============================================================================
// Qualifiers
// ============================================================================

static_assert([]() constexpr {
    FieldTag t = parseFieldTag("name,omitempty", "Member");
    return t.name == "name"
        && t.omitEmpty()
        && t.qualifiersCount == 1;
}(), "Single qualifier");

static_assert([]() constexpr {
    FieldTag t = parseFieldTag("a,,string,omitempty,", "Member");
    return t.name == "a"
        && t.qualifiersCount == 2
        && t.has("string")
        && t.omitEmpty()
        && !t.tooManyQualifiers;
}(), "Empty qualifiers are skipped");

static_assert(!parseFieldTag("name", "Member").omitEmpty());

static_assert([]() constexpr {
    FieldTag t = parseFieldTag("n,a,b,c,d,e,f,g,h,i", "Member");
    return t.qualifiersCount == FieldTag::MaxQualifiers && t.tooManyQualifiers;
}(), "Qualifier overflow is reported");

// ============================================================================
// Ignored members
// ============================================================================

static_assert(parseFieldTag("-", "Member").ignored);
static_assert(!parseFieldTag("-", "Member").wildcard());

static_assert([]() constexpr {
    FieldTag t = parseFieldTag("-,", "Member");
    return !t.ignored && t.name == "-";
}(), "\"-,\" names a member \"-\"");
