#pragma once
#include <cstdint>
#include <cstddef>
#include <string_view>

namespace JsonCatchAll {

/// String literal usable as a template argument: carries field tags such as
/// `Field<&T::name, "name,omitempty">` through the type system.
template <std::size_t N>
struct ConstString {
    char m_data[N + 1];
    static constexpr std::size_t Length = N;

    constexpr ConstString(const char (&str)[N + 1]) {
        for(std::size_t i = 0; i < N + 1; i ++) {
            m_data[i] = str[i];
        }
    }

    constexpr std::string_view toStringView() const {
        return {&m_data[0], Length};
    }

    /// Tags are plain printable text
    constexpr bool isPrintable() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32) return false;
        }
        return true;
    }
};

template <std::size_t N>
ConstString(const char (&str)[N]) -> ConstString<N - 1>;

} // namespace JsonCatchAll
