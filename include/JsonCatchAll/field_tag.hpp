#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace JsonCatchAll {

/// External name reserved for the catch-all member.
inline constexpr std::string_view WildcardFieldName = "*";

namespace qualifiers {
inline constexpr std::string_view omit_empty = "omitempty";
}

/// Result of parsing a field tag of the form `name[,qualifier...]`.
struct FieldTag {
    static constexpr std::size_t MaxQualifiers = 8;

    std::string_view name;
    std::array<std::string_view, MaxQualifiers> qualifiers{};
    std::size_t qualifiersCount = 0;
    bool ignored = false;
    bool tooManyQualifiers = false;

    constexpr bool has(std::string_view q) const {
        for(std::size_t i = 0; i < qualifiersCount; i ++) {
            if(qualifiers[i] == q) return true;
        }
        return false;
    }
    constexpr bool omitEmpty() const {
        return has(qualifiers::omit_empty);
    }
    constexpr bool wildcard() const {
        return !ignored && name == WildcardFieldName;
    }
};

/// Splits a tag into its external name and qualifiers.
/// An empty name part falls back to `memberName`; a tag that is exactly "-"
/// marks the member as not serialized (use "-," for a member named "-").
constexpr FieldTag parseFieldTag(std::string_view tag, std::string_view memberName) {
    FieldTag res{};
    if(tag == "-") {
        res.name = memberName;
        res.ignored = true;
        return res;
    }
    std::size_t comma = tag.find(',');
    std::string_view name = tag.substr(0, comma);
    res.name = name.empty() ? memberName : name;

    if(comma == std::string_view::npos) {
        return res;
    }
    std::string_view rest = tag.substr(comma + 1);
    while(true) {
        std::size_t next = rest.find(',');
        std::string_view q = rest.substr(0, next);
        if(!q.empty()) {
            if(res.qualifiersCount == FieldTag::MaxQualifiers) {
                res.tooManyQualifiers = true;
            } else {
                res.qualifiers[res.qualifiersCount ++] = q;
            }
        }
        if(next == std::string_view::npos) {
            break;
        }
        rest = rest.substr(next + 1);
    }
    return res;
}

} // namespace JsonCatchAll
