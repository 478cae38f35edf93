#ifndef SITENAV_CHARS_HPP
#define SITENAV_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"

namespace sitenav {

using ulight::is_ascii_upper_alpha;
using ulight::to_ascii_upper;

} // namespace sitenav

#endif
