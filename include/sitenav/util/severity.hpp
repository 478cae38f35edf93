#ifndef SITENAV_SEVERITY_HPP
#define SITENAV_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "sitenav/fwd.hpp"

namespace sitenav {

enum struct Severity : Default_Underlying {
    min = 0,
    trace = 0,
    debug = 1,
    info = 2,
    soft_warning = 3,
    warning = 4,
    error = 5,
    fatal = 6,
    max = 6,
    none = 7,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case trace: return u8"TRACE";
    case debug: return u8"DEBUG";
    case info: return u8"INFO";
    case soft_warning: return u8"SOFTWARN";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case fatal: return u8"FATAL";
    case none: break;
    }
    return u8"???";
}

} // namespace sitenav

#endif
