#ifndef SITENAV_NAVIGATION_HPP
#define SITENAV_NAVIGATION_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sitenav/util/assert.hpp"
#include "sitenav/util/result.hpp"

#include "sitenav/fwd.hpp"
#include "sitenav/page_entry.hpp"

namespace sitenav {

/// @brief A single rendered document.
struct Page {
    /// @brief The title shown in navigation menus.
    /// An empty title is considered absent.
    std::pmr::u8string title;
    /// @brief The path of the source document, relative to the documentation directory.
    std::pmr::u8string input_path;
    /// @brief The path of the generated HTML file, relative to the site directory.
    std::pmr::u8string output_path;
    /// @brief The canonical URL path of the page, beginning with `/`.
    std::pmr::u8string absolute_url;
    /// @brief If `true`, the page is not part of the navigation tree.
    bool hidden = false;
    /// @brief The page linked as "previous", or none for the first visible page.
    std::optional<Page_Index> previous_page;
    /// @brief The page linked as "next", or none for the last page.
    std::optional<Page_Index> next_page;
    /// @brief The headers enclosing this page, outermost first.
    /// This is empty for top-level pages and has at most one element.
    std::pmr::vector<Header_Index> ancestors;

    [[nodiscard]]
    bool has_title() const
    {
        return !title.empty();
    }

    [[nodiscard]]
    bool is_homepage() const;
};

/// @brief A group of pages in the navigation tree.
struct Header {
    std::pmr::u8string title;
    /// @brief The pages in this group, in entry order.
    /// This is never empty.
    std::pmr::vector<Page_Index> children;
};

/// @brief A top-level item of the navigation tree.
using Nav_Item = std::variant<Page_Index, Header_Index>;

/// @brief The navigation hierarchy of a site.
/// Pages and headers are stored in arenas and refer to one another by index,
/// so a `Navigation` can be freely moved.
struct Navigation {
    /// @brief All pages in display order, including hidden pages.
    std::pmr::vector<Page> pages;
    /// @brief All headers, in the order in which they were created.
    std::pmr::vector<Header> headers;
    /// @brief The top-level navigation tree, excluding hidden pages and the homepage.
    std::pmr::vector<Nav_Item> items;

    [[nodiscard]]
    explicit Navigation(std::pmr::memory_resource* memory)
        : pages { memory }
        , headers { memory }
        , items { memory }
    {
    }

    [[nodiscard]]
    const Page& page(Page_Index index) const
    {
        SITENAV_ASSERT(std::size_t(index) < pages.size());
        return pages[std::size_t(index)];
    }

    [[nodiscard]]
    Page& page(Page_Index index)
    {
        SITENAV_ASSERT(std::size_t(index) < pages.size());
        return pages[std::size_t(index)];
    }

    [[nodiscard]]
    const Header& header(Header_Index index) const
    {
        SITENAV_ASSERT(std::size_t(index) < headers.size());
        return headers[std::size_t(index)];
    }

    [[nodiscard]]
    Header& header(Header_Index index)
    {
        SITENAV_ASSERT(std::size_t(index) < headers.size());
        return headers[std::size_t(index)];
    }

    /// @brief Returns the title of a top-level item.
    [[nodiscard]]
    std::u8string_view title_of(Nav_Item item) const;

    /// @brief Returns the index of `p`, which shall be an element of `pages`.
    [[nodiscard]]
    Page_Index index_of(const Page& p) const
    {
        SITENAV_ASSERT(&p >= pages.data() && &p < pages.data() + pages.size());
        return Page_Index(&p - pages.data());
    }
};

enum struct Navigation_Error : Default_Underlying {
    /// @brief An entry has an empty path.
    missing_path,
};

/// @brief Builds the navigation hierarchy from a list of page entries.
///
/// Every entry produces exactly one page in `Navigation::pages`, in entry order,
/// except that the first entry referring to the homepage is moved to the front.
/// Entries without child title become top-level pages;
/// consecutive entries with a child title and the same title are grouped under one header.
/// Hidden entries are linked into the previous/next chain, but are not in the tree.
///
/// Building fails only if an entry has an empty path.
/// @param entries the entries, in the user-specified order
/// @param use_directory_urls if `true`, pages map to `name/index.html` and URLs end in `/`
/// @param logger receives errors and informational diagnostics
/// @param memory the memory resource of the resulting `Navigation`
[[nodiscard]]
Result<Navigation, Navigation_Error> build_navigation(
    std::span<const Page_Entry> entries,
    bool use_directory_urls,
    Logger& logger,
    std::pmr::memory_resource* memory
);

} // namespace sitenav

#endif
