#pragma once

#include <iterator>

namespace JsonCatchAll {

// 1) Iterator you can:
//    - read as *it   (convertible to char)
//    - advance as it++ / ++it
template <class It>
concept CharInputIterator =
    std::input_iterator<It> &&
    std::convertible_to<std::iter_reference_t<It>, char>;

// 2) Matching "end" type you can:
//    - compare as it == end / it != end
template <class Sent, class It>
concept CharSentinelFor =
    CharInputIterator<It> &&
    std::sentinel_for<Sent, It>;


template <class It>
concept CharOutputIterator =
    std::output_iterator<It, char>;

template <class Sent, class It>
concept CharSentinelForOut =
    std::sentinel_for<Sent, It>;

/// Sentinel for unbounded outputs such as std::back_insert_iterator.
struct limitless_sentinel {};

template <CharOutputIterator It>
constexpr bool operator==(const It&, const limitless_sentinel&) noexcept {
    return false;
}

} // namespace JsonCatchAll
