#ifndef SITENAV_STRINGS_HPP
#define SITENAV_STRINGS_HPP

#include <charconv>
#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/util/chars.hpp"

namespace sitenav {

[[nodiscard]]
inline std::string_view as_string_view(std::u8string_view str)
{
    return { reinterpret_cast<const char*>(str.data()), str.size() };
}

[[nodiscard]]
inline std::u8string_view as_u8string_view(std::string_view text)
{
    return { reinterpret_cast<const char8_t*>(text.data()), text.size() };
}

/// @brief Returns `str` without any leading occurrences of `c`.
[[nodiscard]]
constexpr std::u8string_view trim_left(std::u8string_view str, char8_t c)
{
    const std::size_t first = str.find_first_not_of(c);
    return first == std::u8string_view::npos ? std::u8string_view {} : str.substr(first);
}

/// @brief Returns `str` without any trailing occurrences of `c`.
[[nodiscard]]
constexpr std::u8string_view trim_right(std::u8string_view str, char8_t c)
{
    const std::size_t last = str.find_last_not_of(c);
    return last == std::u8string_view::npos ? std::u8string_view {} : str.substr(0, last + 1);
}

/// @brief Returns `true` if `str` contains no upper-case ASCII letters.
[[nodiscard]]
constexpr bool is_ascii_lower_case(std::u8string_view str)
{
    for (const char8_t c : str) { // NOLINT(readability-use-anyofallof)
        if (is_ascii_upper_alpha(c)) {
            return false;
        }
    }
    return true;
}

struct Split_Result {
    std::u8string_view head;
    std::u8string_view tail;
    bool found;
};

/// @brief Splits `str` at the first occurrence of `separator`.
/// If `separator` is not found, the whole string is returned as `head`
/// and `tail` is empty.
[[nodiscard]]
constexpr Split_Result split_first(std::u8string_view str, char8_t separator)
{
    const std::size_t pos = str.find(separator);
    if (pos == std::u8string_view::npos) {
        return { .head = str, .tail = {}, .found = false };
    }
    return { .head = str.substr(0, pos), .tail = str.substr(pos + 1), .found = true };
}

/// @brief Appends the decimal representation of `x` to `out`.
inline void append_integer(std::pmr::u8string& out, std::size_t x)
{
    char buffer[24];
    const std::to_chars_result result = std::to_chars(std::begin(buffer), std::end(buffer), x);
    out.append(std::begin(buffer), result.ptr);
}

} // namespace sitenav

#endif
