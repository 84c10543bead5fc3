#pragma once

#include <cstddef>

namespace JsonCatchAll {

/// Behaviour switches of a Codec, fixed for the codec's lifetime.
struct Config {
    bool escapeHtml = true;            // write <, >, & as \u003c, \u003e, \u0026
    bool sortMapKeys = true;           // sort keys of unordered maps on output
    bool validateRawJson = true;       // reject malformed RawJson fragments on output
    bool caseSensitive = false;        // no case-insensitive fallback when matching keys
    bool disallowUnknownFields = false; // unknown keys fail types that have no catch-all field
    std::size_t maxDepth = 64;

    static constexpr Config compatibleWithStandardLibrary() {
        return Config{};
    }
};

} // namespace JsonCatchAll
