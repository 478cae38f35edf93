#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>

#include "sitenav/util/ansi.hpp"
#include "sitenav/util/severity.hpp"
#include "sitenav/util/strings.hpp"

#include "sitenav/diagnostic.hpp"
#include "sitenav/navigation.hpp"
#include "sitenav/print.hpp"
#include "sitenav/site_navigation.hpp"

namespace sitenav {
namespace {

constexpr std::u8string_view active_marker = u8" [*]";

void append_indent(std::pmr::u8string& out, std::size_t depth)
{
    out.append(depth * print_indent_width, u8' ');
}

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace          ? ansi::black
        : severity <= Severity::debug          ? ansi::h_black
        : severity <= Severity::info           ? ansi::blue
        : severity <= Severity::soft_warning   ? ansi::green
        : severity <= Severity::warning        ? ansi::h_yellow
        : severity <= Severity::error          ? ansi::h_red
        : severity <= Severity::fatal          ? ansi::red
                                               : ansi::magenta;
}

} // namespace

void print_page(std::pmr::u8string& out, const Page& page, bool active, std::size_t depth)
{
    append_indent(out, depth);
    out += page.has_title() ? std::u8string_view { page.title } : blank_title;
    out += u8" - ";
    out += page.absolute_url;
    if (active) {
        out += active_marker;
    }
    out += u8'\n';
}

void print_nav_item(
    std::pmr::u8string& out,
    const Navigation& navigation,
    Nav_Item item,
    const Render_Context& context,
    std::size_t depth
)
{
    if (const auto* const page = std::get_if<Page_Index>(&item)) {
        print_page(out, navigation.page(*page), context.is_active(*page), depth);
        return;
    }

    const auto header_index = std::get<Header_Index>(item);
    const Header& header = navigation.header(header_index);
    append_indent(out, depth);
    out += header.title;
    if (context.is_active(navigation, header_index)) {
        out += active_marker;
    }
    out += u8'\n';
    for (const Page_Index child : header.children) {
        print_nav_item(out, navigation, child, context, depth + 1);
    }
}

void print_site_navigation(
    std::pmr::u8string& out,
    const Navigation& navigation,
    const Render_Context& context
)
{
    if (!navigation.pages.empty()) {
        print_page(out, navigation.pages.front(), context.is_active(Page_Index {}));
    }
    for (const Nav_Item item : navigation.items) {
        print_nav_item(out, navigation, item, context);
    }
}

void print_diagnostic(std::pmr::u8string& out, const Diagnostic& diagnostic, bool colors)
{
    if (colors) {
        out += severity_highlight(diagnostic.severity);
    }
    out += severity_tag(diagnostic.severity);
    if (colors) {
        out += ansi::reset;
    }
    out += u8": ";
    out += diagnostic.message;
    if (colors) {
        out += ansi::h_black;
    }
    out += u8" [";
    out += diagnostic.id;
    out += u8']';
    if (colors) {
        out += ansi::reset;
    }
    out += u8'\n';
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

void print_stdout(std::u8string_view str)
{
    std::cout << str;
}

void print_stderr(std::u8string_view str)
{
    std::cerr << str;
}

} // namespace sitenav
