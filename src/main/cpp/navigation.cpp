#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <variant>
#include <vector>

#include "sitenav/util/assert.hpp"
#include "sitenav/util/posix_path.hpp"
#include "sitenav/util/result.hpp"
#include "sitenav/util/strings.hpp"

#include "sitenav/diagnostic.hpp"
#include "sitenav/navigation.hpp"
#include "sitenav/page_entry.hpp"
#include "sitenav/path_resolution.hpp"
#include "sitenav/services.hpp"

namespace sitenav {

bool Page::is_homepage() const
{
    return sitenav::is_homepage(input_path);
}

std::u8string_view Navigation::title_of(Nav_Item item) const
{
    if (const auto* const p = std::get_if<Page_Index>(&item)) {
        return page(*p).title;
    }
    return header(std::get<Header_Index>(item)).title;
}

namespace {

/// @brief Returns the segment at `index` within the `/`-separated `path`,
/// or null if there are not that many segments.
[[nodiscard]]
std::optional<std::u8string_view> path_segment(std::u8string_view path, std::size_t index)
{
    for (std::size_t i = 0;; ++i) {
        const Split_Result parts = split_first(path, posix::separator);
        if (i == index) {
            return parts.head;
        }
        if (!parts.found) {
            return {};
        }
        path = parts.tail;
    }
}

/// @brief Returns the order in which `entries` are processed.
/// This is the entry order, except that the first homepage entry is moved to the front.
[[nodiscard]]
std::pmr::vector<std::size_t> processing_order(
    std::span<const Page_Entry> entries,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    std::pmr::vector<std::size_t> result { memory };
    result.reserve(entries.size());
    for (std::size_t i = 0; i < entries.size(); ++i) {
        result.push_back(i);
    }

    const auto first_homepage = std::ranges::find_if(entries, [&](const Page_Entry& e) {
        return is_homepage(e.path, memory);
    });
    if (first_homepage == entries.end()) {
        return result;
    }
    const auto homepage_index = std::size_t(first_homepage - entries.begin());

    const auto homepage_count = std::ranges::count_if(entries, [&](const Page_Entry& e) {
        return is_homepage(e.path, memory);
    });
    if (homepage_count > 1) {
        logger.log(
            Severity::warning, diagnostic::nav_homepage_duplicate,
            u8"More than one page entry refers to the homepage. "
            u8"Only the first one is placed at the front."
        );
    }

    if (homepage_index != 0) {
        std::rotate(result.begin(), result.begin() + std::ptrdiff_t(homepage_index),
                    result.begin() + std::ptrdiff_t(homepage_index) + 1);
        if (logger.can_log(Severity::debug)) {
            std::pmr::u8string message { u8"Moved homepage \"", memory };
            message += first_homepage->path;
            message += u8"\" to the front of the page sequence.";
            logger(Diagnostic { .severity = Severity::debug,
                                .id = diagnostic::nav_homepage_moved,
                                .message = message });
        }
    }
    return result;
}

struct Navigation_Builder {
private:
    Navigation& m_nav;
    Logger& m_logger;
    /// @brief The memory resource of the navigation being built.
    std::pmr::memory_resource* m_memory;
    /// @brief Memory for temporary data such as diagnostic messages.
    std::pmr::memory_resource* m_scratch;
    bool m_use_directory_urls;
    /// @brief The most recent visible page.
    std::optional<Page_Index> m_previous;
    /// @brief The most recent hidden page, if no visible page has followed it yet.
    std::optional<Page_Index> m_hidden_previous;
    std::pmr::unordered_set<std::u8string_view> m_seen_paths;

public:
    [[nodiscard]]
    Navigation_Builder(
        Navigation& nav,
        bool use_directory_urls,
        Logger& logger,
        std::pmr::memory_resource* scratch
    )
        : m_nav { nav }
        , m_logger { logger }
        , m_memory { nav.pages.get_allocator().resource() }
        , m_scratch { scratch }
        , m_use_directory_urls { use_directory_urls }
        , m_seen_paths { scratch }
    {
    }

    void add(const Page_Entry& entry)
    {
        SITENAV_ASSERT(!entry.path.empty());
        check_duplicate(entry.path);

        const bool hidden = entry.is_hidden();
        std::pmr::u8string title = resolve_title(entry);
        std::pmr::u8string child_title = resolve_child_title(entry);

        const auto index = Page_Index(m_nav.pages.size());
        if (hidden) {
            const std::u8string_view page_title = child_title.empty()
                ? std::u8string_view {}
                : std::u8string_view { child_title };
            push_page(entry, page_title, true);
            if (page_title.empty()) {
                append_filename_title(m_nav.page(index).title, posix::basename(entry.path));
            }
        }
        else if (child_title.empty()) {
            push_page(entry, title, false);
            add_top_level(index);
        }
        else {
            push_page(entry, child_title, false);
            add_grouped(index, std::move(title));
        }

        link(index, hidden);
    }

private:
    [[nodiscard]]
    std::pmr::u8string resolve_title(const Page_Entry& entry) const
    {
        if (const std::pmr::u8string* const explicit_title = entry.explicit_title()) {
            return { *explicit_title, m_memory };
        }
        std::pmr::u8string result { m_memory };
        if (!entry.is_hidden()) {
            append_filename_title(result, *path_segment(entry.path, 0));
        }
        return result;
    }

    [[nodiscard]]
    std::pmr::u8string resolve_child_title(const Page_Entry& entry) const
    {
        if (entry.child_title) {
            return { *entry.child_title, m_memory };
        }
        std::pmr::u8string result { m_memory };
        if (const std::optional<std::u8string_view> segment = path_segment(entry.path, 1)) {
            append_filename_title(result, *segment);
        }
        return result;
    }

    void check_duplicate(std::u8string_view path)
    {
        if (m_seen_paths.insert(path).second) {
            return;
        }
        if (m_logger.can_log(Severity::warning)) {
            std::pmr::u8string message { u8"The document \"", m_scratch };
            message += path;
            message += u8"\" is listed more than once.";
            m_logger(Diagnostic { .severity = Severity::warning,
                                  .id = diagnostic::nav_page_duplicate,
                                  .message = message });
        }
    }

    void push_page(const Page_Entry& entry, std::u8string_view title, bool hidden)
    {
        Page page {
            .title = std::pmr::u8string { title, m_memory },
            .input_path = std::pmr::u8string { entry.path, m_memory },
            .output_path = std::pmr::u8string { m_memory },
            .absolute_url = std::pmr::u8string { m_memory },
            .hidden = hidden,
            .previous_page = {},
            .next_page = {},
            .ancestors = std::pmr::vector<Header_Index> { m_memory },
        };
        append_output_path(page.output_path, entry.path, m_use_directory_urls);
        append_url_path(page.absolute_url, entry.path, m_use_directory_urls);
        m_nav.pages.push_back(std::move(page));
    }

    void add_top_level(Page_Index index)
    {
        const Page& page = m_nav.page(index);
        // Pages without a title and the homepage are only reachable through
        // previous/next links, not through the navigation tree.
        if (is_homepage(page.input_path, m_scratch)) {
            return;
        }
        if (!page.has_title()) {
            if (m_logger.can_log(Severity::soft_warning)) {
                std::pmr::u8string message { u8"The page \"", m_scratch };
                message += page.input_path;
                message += u8"\" has no title and is not shown in the navigation.";
                m_logger(Diagnostic { .severity = Severity::soft_warning,
                                      .id = diagnostic::nav_page_untitled,
                                      .message = message });
            }
            return;
        }
        m_nav.items.push_back(index);
    }

    void add_grouped(Page_Index index, std::pmr::u8string&& header_title)
    {
        if (!m_nav.items.empty()) {
            if (const auto* const last = std::get_if<Header_Index>(&m_nav.items.back());
                last && m_nav.header(*last).title == header_title) {
                m_nav.header(*last).children.push_back(index);
                m_nav.page(index).ancestors.push_back(*last);
                return;
            }
        }

        const bool is_split = std::ranges::any_of(m_nav.headers, [&](const Header& h) {
            return h.title == header_title;
        });
        if (is_split && m_logger.can_log(Severity::soft_warning)) {
            std::pmr::u8string message { u8"The header \"", m_scratch };
            message += header_title;
            message += u8"\" appears more than once in the navigation "
                       u8"because its pages are not listed consecutively.";
            m_logger(Diagnostic { .severity = Severity::soft_warning,
                                  .id = diagnostic::nav_header_split,
                                  .message = message });
        }

        const auto header_index = Header_Index(m_nav.headers.size());
        Header header {
            .title = std::move(header_title),
            .children = std::pmr::vector<Page_Index> { m_memory },
        };
        header.children.push_back(index);
        m_nav.headers.push_back(std::move(header));
        m_nav.items.push_back(header_index);
        m_nav.page(index).ancestors.push_back(header_index);
    }

    void link(Page_Index index, bool hidden)
    {
        Page& page = m_nav.page(index);
        if (m_previous) {
            page.previous_page = m_previous;
            m_nav.page(*m_previous).next_page = index;
        }
        // A hidden page links forward to its successor,
        // but its successor links back to the last visible page.
        if (m_hidden_previous) {
            m_nav.page(*m_hidden_previous).next_page = index;
        }

        if (hidden) {
            m_hidden_previous = index;
        }
        else {
            m_hidden_previous.reset();
            m_previous = index;
        }
    }
};

} // namespace

Result<Navigation, Navigation_Error> build_navigation(
    std::span<const Page_Entry> entries,
    bool use_directory_urls,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    for (const Page_Entry& entry : entries) {
        if (entry.path.empty()) {
            logger.log(
                Severity::error, diagnostic::entry_path_missing, u8"Page entry has an empty path."
            );
            return Navigation_Error::missing_path;
        }
    }

    Navigation result { memory };
    result.pages.reserve(entries.size());

    std::pmr::unsynchronized_pool_resource scratch { memory };
    const std::pmr::vector<std::size_t> order = processing_order(entries, logger, &scratch);

    {
        Navigation_Builder builder { result, use_directory_urls, logger, &scratch };
        for (const std::size_t i : order) {
            builder.add(entries[i]);
        }
    }

    if (logger.can_log(Severity::debug)) {
        std::pmr::u8string message { u8"Built navigation with ", &scratch };
        append_integer(message, result.pages.size());
        message += u8" pages, ";
        append_integer(message, result.headers.size());
        message += u8" headers, and ";
        append_integer(message, result.items.size());
        message += u8" top-level items.";
        logger(Diagnostic { .severity = Severity::debug,
                            .id = diagnostic::nav_built,
                            .message = message });
    }

    return result;
}

} // namespace sitenav
