#ifndef SITENAV_DIAGNOSTIC_HPP
#define SITENAV_DIAGNOSTIC_HPP

#include <string_view>

#include "sitenav/util/severity.hpp"

#include "sitenav/fwd.hpp"

namespace sitenav {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// ENTRY DIAGNOSTICS ===============================================================================

/// @brief A raw page entry consists of no fields, or of more than three fields.
inline constexpr std::u8string_view entry_malformed = u8"entry.malformed";

/// @brief A page entry has an empty path.
inline constexpr std::u8string_view entry_path_missing = u8"entry.path.missing";

// NAVIGATION DIAGNOSTICS ==========================================================================

/// @brief The homepage entry was not listed first and has been moved to the front.
inline constexpr std::u8string_view nav_homepage_moved = u8"nav.homepage.moved";

/// @brief More than one entry refers to the homepage.
/// Only the first one is moved to the front.
inline constexpr std::u8string_view nav_homepage_duplicate = u8"nav.homepage.duplicate";

/// @brief The same source document is listed more than once.
inline constexpr std::u8string_view nav_page_duplicate = u8"nav.page.duplicate";

/// @brief A grouped entry uses the title of a header which is not the most recent item,
/// so a second header with the same title is created.
inline constexpr std::u8string_view nav_header_split = u8"nav.header.split";

/// @brief A top-level page has no title and is not shown in the navigation tree.
inline constexpr std::u8string_view nav_page_untitled = u8"nav.page.untitled";

/// @brief The navigation was built.
inline constexpr std::u8string_view nav_built = u8"nav.built";

} // namespace diagnostic

} // namespace sitenav

#endif
