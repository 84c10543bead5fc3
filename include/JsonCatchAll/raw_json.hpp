#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "reader.hpp"

namespace JsonCatchAll {

/// Opaque JSON fragment: the exact bytes of one JSON value, kept as read.
/// Decoding captures the value verbatim; encoding writes it back unchanged.
struct RawJson {
    std::string bytes;

    RawJson() = default;
    explicit RawJson(std::string b) : bytes(std::move(b)) {}

    bool empty() const { return bytes.empty(); }
    std::string_view view() const { return bytes; }

    bool operator==(const RawJson&) const = default;
};

/// Store for object keys a schema does not declare, keyed by the original
/// (case-preserved) key.
using AdditionalProperties = std::map<std::string, RawJson>;

/// True if `fragment` is exactly one well-formed JSON value, optionally
/// surrounded by whitespace.
inline bool isValidJson(std::string_view fragment, std::size_t maxDepth = 64) {
    JsonIteratorReader<const char*, const char*, 512> reader(
        fragment.data(), fragment.data() + fragment.size(), maxDepth);
    return reader.skip_value() && reader.finish();
}

} // namespace JsonCatchAll
