#ifndef SITENAV_PRINT_HPP
#define SITENAV_PRINT_HPP

#include <cstddef>
#include <iosfwd>
#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/fwd.hpp"
#include "sitenav/navigation.hpp"

namespace sitenav {

/// @brief Text printed in place of an absent page title.
inline constexpr std::u8string_view blank_title = u8"[blank]";

/// @brief Appends a line for `page` like `"About - /about/ [*]"`,
/// indented by `depth` levels.
void print_page(std::pmr::u8string& out, const Page& page, bool active, std::size_t depth = 0);

/// @brief Appends `item` and, for headers, its children on subsequent lines.
void print_nav_item(
    std::pmr::u8string& out,
    const Navigation& navigation,
    Nav_Item item,
    const Render_Context& context,
    std::size_t depth = 0
);

/// @brief Appends the homepage followed by every top-level item of the navigation,
/// with active items marked as such in `context`.
void print_site_navigation(
    std::pmr::u8string& out,
    const Navigation& navigation,
    const Render_Context& context
);

/// @brief Appends a single line for `diagnostic`,
/// like `"WARNING: The document \"a.md\" is listed more than once. [nav.page.duplicate]"`.
/// @param colors if `true`, ANSI escape sequences highlight the severity and id
void print_diagnostic(std::pmr::u8string& out, const Diagnostic& diagnostic, bool colors);

std::ostream& operator<<(std::ostream& out, std::u8string_view str);

void print_stdout(std::u8string_view str);
void print_stderr(std::u8string_view str);

} // namespace sitenav

#endif
