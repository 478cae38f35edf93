#ifndef SITENAV_FWD_HPP
#define SITENAV_FWD_HPP

#include <cstddef>

#include "sitenav/settings.hpp"

SITENAV_IF_DEBUG() // silence unused warning for settings.hpp

namespace sitenav {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

struct Collecting_Logger;
struct Diagnostic;
enum struct Entry_Error : Default_Underlying;
struct File_Context;
struct Header;
struct Hidden_Entry;
struct Ignorant_Logger;
struct Logger;
struct Navigation;
enum struct Navigation_Error : Default_Underlying;
struct Navigation_Options;
struct Page;
struct Page_Entry;
struct Page_Walk;
struct Render_Context;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Site_Navigation;
struct Success_Tag;
struct URL_Context;

/// @brief A handle to a `Page` within the flat page sequence of a `Navigation`.
enum struct Page_Index : std::size_t { };

/// @brief A handle to a `Header` within the header arena of a `Navigation`.
enum struct Header_Index : std::size_t { };

} // namespace sitenav

#endif
