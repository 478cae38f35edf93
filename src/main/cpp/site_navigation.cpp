#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <ranges>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sitenav/util/result.hpp"

#include "sitenav/navigation.hpp"
#include "sitenav/page_entry.hpp"
#include "sitenav/site_navigation.hpp"

namespace sitenav {

bool Render_Context::is_active(const Navigation& navigation, Header_Index header) const
{
    if (!current_page) {
        return false;
    }
    const Page& page = navigation.page(*current_page);
    return std::ranges::find(page.ancestors, header) != page.ancestors.end();
}

bool Render_Context::is_active(const Navigation& navigation, Nav_Item item) const
{
    if (const auto* const page = std::get_if<Page_Index>(&item)) {
        return is_active(*page);
    }
    return is_active(navigation, std::get<Header_Index>(item));
}

const Page* Page_Walk::next()
{
    m_started = true;
    if (m_next >= m_navigation->pages.size()) {
        m_context->current_page.reset();
        return nullptr;
    }

    const auto index = Page_Index(m_next++);
    const Page& page = m_navigation->page(index);
    m_context->current_page = index;
    m_context->url.set_current_url(page.absolute_url);
    m_context->file.set_current_path(page.input_path);
    return &page;
}

Result<Site_Navigation, Navigation_Error> Site_Navigation::build(
    std::span<const Page_Entry> entries,
    const Navigation_Options& options,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    Result<Navigation, Navigation_Error> navigation
        = build_navigation(entries, options.use_directory_urls, logger, memory);
    if (!navigation) {
        return navigation.error();
    }
    return Result<Site_Navigation, Navigation_Error> {
        success_tag, std::move(*navigation), options, memory
    };
}

void Site_Navigation::get_source_files(std::pmr::vector<std::u8string_view>& out) const
{
    const std::size_t initial_size = out.size();
    for (const Page& page : m_navigation.pages) {
        out.push_back(page.input_path);
    }
    const auto added = std::ranges::subrange(out.begin() + std::ptrdiff_t(initial_size), out.end());
    std::ranges::sort(added);
    const auto duplicates = std::ranges::unique(added);
    out.erase(duplicates.begin(), duplicates.end());
}

} // namespace sitenav
