#pragma once

#include <concepts>
#include <type_traits>
#include <utility>
#include <memory>

#include "const_string.hpp"

namespace JsonCatchAll {

template <class T, ConstString Tag>
struct Tagged;

template<class T>
struct is_tagged : std::false_type {};

template<class T, ConstString Tag>
struct is_tagged<Tagged<T, Tag>> : std::true_type {};

template<class T>
inline constexpr bool is_tagged_v = is_tagged<T>::value;

/// Attaches a field tag to an aggregate member found through PFR:
///
///     struct Doc {
///         std::string Name;
///         Tagged<int, "count,omitempty"> count;
///         Tagged<AdditionalProperties, "*"> extra;
///     };
template <class T, ConstString Tag>
struct Tagged {
    T value{};
    using value_type = T;
    static constexpr auto TagString = Tag;
    static_assert(Tag.isPrintable(), "[[[ JsonCatchAll ]]] Tagged<> tag contains control characters");

    constexpr Tagged() = default;
    constexpr Tagged(const Tagged&) = default;
    constexpr Tagged(Tagged&&) = default;
    constexpr Tagged& operator=(const Tagged&) = default;
    constexpr Tagged& operator=(Tagged&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Tagged(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Tagged& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

template<class T, ConstString TagL, ConstString TagR>
constexpr bool operator==(const Tagged<T, TagL>& lhs, const Tagged<T, TagR>& rhs) {
    return lhs.value == rhs.value;
}

template<class T, ConstString Tag, class U>
    requires (!is_tagged_v<U>) && requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Tagged<T, Tag>& lhs, const U& rhs) {
    return lhs.value == rhs;
}

} // namespace JsonCatchAll
