#ifndef SITENAV_SITE_NAVIGATION_HPP
#define SITENAV_SITE_NAVIGATION_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "sitenav/util/assert.hpp"
#include "sitenav/util/result.hpp"

#include "sitenav/file_context.hpp"
#include "sitenav/fwd.hpp"
#include "sitenav/navigation.hpp"
#include "sitenav/page_entry.hpp"
#include "sitenav/url_context.hpp"

namespace sitenav {

struct Navigation_Options {
    /// @brief The base URL of the site, used as a prefix for absolute URLs.
    std::u8string_view site_url;
    /// @brief If `true`, pages map to `name/index.html` and their URLs to `name/`.
    /// Otherwise, pages map to `name.html` and their URLs to `name.html`.
    bool use_directory_urls = true;
    /// @brief If `true`, URLs of pages are prefixed with `site_url`
    /// instead of being relative to the page being rendered.
    bool use_absolute_urls = false;
};

/// @brief The state of a single render pass over a `Site_Navigation`.
///
/// The active page and the URL and file contexts only exist here,
/// not within the navigation itself,
/// so multiple render passes over the same navigation can use separate contexts.
struct Render_Context {
    URL_Context url;
    File_Context file;
    /// @brief The page currently being rendered, if any.
    std::optional<Page_Index> current_page;

    [[nodiscard]]
    explicit Render_Context(const Navigation_Options& options, std::pmr::memory_resource* memory)
        : url { options.site_url, options.use_absolute_urls, memory }
        , file { memory }
    {
    }

    /// @brief Returns `true` if `page` is the page currently being rendered.
    [[nodiscard]]
    bool is_active(Page_Index page) const
    {
        return current_page == page;
    }

    /// @brief Returns `true` if `header` encloses the page currently being rendered.
    [[nodiscard]]
    bool is_active(const Navigation& navigation, Header_Index header) const;

    /// @brief Returns `true` if `item` is active, i.e. if it is the current page,
    /// or a header enclosing it.
    [[nodiscard]]
    bool is_active(const Navigation& navigation, Nav_Item item) const;

    /// @brief Appends the URL of `page` as seen from the current page.
    void append_page_url(std::pmr::u8string& out, const Page& page) const
    {
        url.make_relative(out, page.absolute_url);
    }

    /// @brief Returns the URL of `page` as seen from the current page.
    [[nodiscard]]
    std::pmr::u8string page_url(const Page& page) const
    {
        return url.make_relative(page.absolute_url);
    }
};

struct Page_Walk_Sentinel { };

/// @brief A single forward pass over all pages of a navigation, in display order.
///
/// Advancing the walk activates the next page in the `Render_Context`
/// and points its URL and file contexts at that page.
/// Once all pages have been visited, no page remains active.
/// A walk cannot be restarted; a new one has to be obtained.
struct Page_Walk {
private:
    const Navigation* m_navigation;
    Render_Context* m_context;
    std::size_t m_next = 0;
    bool m_started = false;

public:
    [[nodiscard]]
    Page_Walk(const Navigation& navigation, Render_Context& context)
        : m_navigation { &navigation }
        , m_context { &context }
    {
    }

    /// @brief Activates the next page and returns it,
    /// or deactivates the last page and returns null if all pages have been visited.
    [[nodiscard]]
    const Page* next();

    struct iterator {
        using value_type = Page;
        using difference_type = std::ptrdiff_t;

        Page_Walk* walk = nullptr;
        const Page* current = nullptr;

        [[nodiscard]]
        const Page& operator*() const
        {
            SITENAV_ASSERT(current);
            return *current;
        }

        [[nodiscard]]
        const Page* operator->() const
        {
            return current;
        }

        iterator& operator++()
        {
            current = walk->next();
            return *this;
        }

        void operator++(int)
        {
            ++*this;
        }

        [[nodiscard]]
        friend bool operator==(const iterator& i, Page_Walk_Sentinel)
        {
            return i.current == nullptr;
        }
    };

    /// @brief Starts the walk and activates the first page.
    /// This shall be called at most once.
    [[nodiscard]]
    iterator begin()
    {
        SITENAV_ASSERT(!m_started);
        return iterator { this, next() };
    }

    [[nodiscard]]
    Page_Walk_Sentinel end() const
    {
        return {};
    }
};

/// @brief The navigation of a whole site, combining the navigation tree and the flat
/// page sequence with the options needed to render URLs.
struct Site_Navigation {
private:
    Navigation m_navigation;
    std::pmr::u8string m_site_url;
    bool m_use_directory_urls;
    bool m_use_absolute_urls;

public:
    /// @brief Builds the navigation for `entries`.
    /// Errors are reported to `logger`.
    [[nodiscard]]
    static Result<Site_Navigation, Navigation_Error> build(
        std::span<const Page_Entry> entries,
        const Navigation_Options& options,
        Logger& logger,
        std::pmr::memory_resource* memory
    );

    [[nodiscard]]
    Site_Navigation(
        Navigation&& navigation,
        const Navigation_Options& options,
        std::pmr::memory_resource* memory
    )
        : m_navigation { std::move(navigation) }
        , m_site_url { options.site_url, memory }
        , m_use_directory_urls { options.use_directory_urls }
        , m_use_absolute_urls { options.use_absolute_urls }
    {
    }

    [[nodiscard]]
    const Navigation& get_navigation() const
    {
        return m_navigation;
    }

    /// @brief Returns the options this navigation was built with.
    /// The result refers to storage within `*this`.
    [[nodiscard]]
    Navigation_Options get_options() const
    {
        return { .site_url = m_site_url,
                 .use_directory_urls = m_use_directory_urls,
                 .use_absolute_urls = m_use_absolute_urls };
    }

    /// @brief Returns the top-level navigation tree.
    [[nodiscard]]
    std::span<const Nav_Item> items() const
    {
        return m_navigation.items;
    }

    /// @brief Returns all pages, including hidden pages, in display order.
    [[nodiscard]]
    std::span<const Page> pages() const
    {
        return m_navigation.pages;
    }

    /// @brief Returns the first page, or null if there are no pages.
    [[nodiscard]]
    const Page* homepage() const
    {
        return m_navigation.pages.empty() ? nullptr : &m_navigation.pages.front();
    }

    /// @brief Appends the input paths of all pages to `out`, sorted and without duplicates.
    void get_source_files(std::pmr::vector<std::u8string_view>& out) const;

    /// @brief Creates a fresh render context with no active page.
    [[nodiscard]]
    Render_Context make_render_context(std::pmr::memory_resource* memory) const
    {
        return Render_Context { get_options(), memory };
    }

    /// @brief Returns a walk over all pages which updates `context` as it advances.
    /// `context` shall outlive the walk,
    /// and shall not be used by another walk at the same time.
    [[nodiscard]]
    Page_Walk walk_pages(Render_Context& context) const
    {
        return Page_Walk { m_navigation, context };
    }
};

} // namespace sitenav

#endif
