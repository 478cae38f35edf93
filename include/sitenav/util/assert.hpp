#ifndef SITENAV_ASSERT_HPP
#define SITENAV_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace sitenav {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define SITENAV_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define SITENAV_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define SITENAV_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define SITENAV_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace sitenav

#endif
