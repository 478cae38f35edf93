#ifndef SITENAV_TTY_HPP
#define SITENAV_TTY_HPP

#include <cstdio>

#include "sitenav/fwd.hpp"

namespace sitenav {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]]
bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stdout)` is `true`.
extern const bool is_stdout_tty;
/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace sitenav
#endif
