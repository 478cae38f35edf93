#ifndef SITENAV_SETTINGS_HPP
#define SITENAV_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define SITENAV_DEBUG 1
#define SITENAV_IF_DEBUG(...) __VA_ARGS__
#define SITENAV_IF_NOT_DEBUG(...)
#else // release builds
#define SITENAV_IF_DEBUG(...)
#define SITENAV_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define SITENAV_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define SITENAV_GCC 1
#endif

namespace sitenav {

#if !defined(SITENAV_CLANG) && !defined(SITENAV_GCC)
#error "sitenav currently only supports Clang or GCC."
#endif

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = SITENAV_IF_DEBUG(true) SITENAV_IF_NOT_DEBUG(false);

/// @brief The number of spaces per nesting level in textual navigation dumps.
inline constexpr std::size_t print_indent_width = 4;

} // namespace sitenav

#endif
