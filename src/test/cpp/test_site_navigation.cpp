#include <cstddef>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "sitenav/util/result.hpp"

#include "sitenav/collecting_logger.hpp"
#include "sitenav/diagnostic.hpp"
#include "sitenav/navigation.hpp"
#include "sitenav/site_navigation.hpp"

#include "entries.hpp"

namespace sitenav {
namespace {

using namespace std::literals;

struct Site_Navigation_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Entry_List list { &memory };

    Result<Site_Navigation, Navigation_Error> build(const Navigation_Options& options = {})
    {
        return Site_Navigation::build(list.get(), options, logger, &memory);
    }

    void add_basic_site()
    {
        list({ u8"index.md" })({ u8"about.md", u8"About" })
            ({ u8"api/overview.md", u8"API", u8"Overview" })
            ({ u8"api/ref.md", u8"API", u8"Reference" });
    }
};

TEST_F(Site_Navigation_Test, options)
{
    add_basic_site();
    const Result<Site_Navigation, Navigation_Error> site = build({
        .site_url = u8"https://example.com/",
        .use_directory_urls = false,
        .use_absolute_urls = true,
    });
    ASSERT_TRUE(site);

    const Navigation_Options options = site->get_options();
    EXPECT_EQ(u8"https://example.com/"sv, options.site_url);
    EXPECT_FALSE(options.use_directory_urls);
    EXPECT_TRUE(options.use_absolute_urls);
}

TEST_F(Site_Navigation_Test, build_failure)
{
    add_basic_site();
    list.entries.push_back(Page_Entry {
        .path = std::pmr::u8string { &memory },
        .title = std::optional<std::pmr::u8string> {},
        .child_title = {},
    });

    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_FALSE(site);
    EXPECT_EQ(Navigation_Error::missing_path, site.error());
}

TEST_F(Site_Navigation_Test, homepage)
{
    list({ u8"about.md", u8"About" })({ u8"index.md" });
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);

    const Page* const home = site->homepage();
    ASSERT_NE(nullptr, home);
    EXPECT_EQ(u8"index.md"sv, home->input_path);
    EXPECT_EQ(u8"Home"sv, home->title);
    EXPECT_EQ(2u, site->pages().size());
    EXPECT_EQ(1u, site->items().size());
}

TEST_F(Site_Navigation_Test, no_pages)
{
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    EXPECT_EQ(nullptr, site->homepage());
    EXPECT_TRUE(site->items().empty());

    Render_Context context = site->make_render_context(&memory);
    Page_Walk walk = site->walk_pages(context);
    EXPECT_EQ(nullptr, walk.next());
    EXPECT_FALSE(context.current_page);
}

TEST_F(Site_Navigation_Test, source_files)
{
    list({ u8"index.md" })({ u8"b.md", u8"B" })({ u8"a.md", u8"A" })({ u8"a.md", u8"A again" });
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);

    std::pmr::vector<std::u8string_view> sources { &memory };
    sources.push_back(u8"zzz.md");
    site->get_source_files(sources);

    const std::u8string_view expected[] { u8"zzz.md", u8"a.md", u8"b.md", u8"index.md" };
    ASSERT_EQ(std::size(expected), sources.size());
    for (std::size_t i = 0; i < sources.size(); ++i) {
        EXPECT_EQ(expected[i], sources[i]);
    }
}

TEST_F(Site_Navigation_Test, nothing_active_initially)
{
    add_basic_site();
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    const Navigation& nav = site->get_navigation();

    const Render_Context context = site->make_render_context(&memory);
    EXPECT_FALSE(context.current_page);
    EXPECT_EQ(u8"/"sv, context.url.get_base_path());
    EXPECT_EQ(u8""sv, context.file.get_current_path());
    for (const Nav_Item item : nav.items) {
        EXPECT_FALSE(context.is_active(nav, item));
    }
    EXPECT_EQ(u8"about/"sv, context.page_url(nav.pages[1]));
}

TEST_F(Site_Navigation_Test, walk_activates_pages)
{
    add_basic_site();
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    const Navigation& nav = site->get_navigation();

    Render_Context context = site->make_render_context(&memory);
    std::size_t visited = 0;
    for (const Page& page : site->walk_pages(context)) {
        const Page_Index index = nav.index_of(page);
        EXPECT_EQ(Page_Index { visited }, index);
        EXPECT_EQ(index, context.current_page);
        EXPECT_EQ(page.input_path, context.file.get_current_path());

        for (const Page& other : nav.pages) {
            EXPECT_EQ(&other == &page, context.is_active(nav.index_of(other)));
        }
        // The header is active exactly while one of its children is.
        EXPECT_EQ(!page.ancestors.empty(), context.is_active(nav, Header_Index { 0 }));
        EXPECT_EQ(
            !page.ancestors.empty(), context.is_active(nav, Nav_Item { Header_Index { 0 } })
        );
        ++visited;
    }

    EXPECT_EQ(4u, visited);
    EXPECT_FALSE(context.current_page);
    EXPECT_FALSE(context.is_active(nav, Header_Index { 0 }));
}

TEST_F(Site_Navigation_Test, urls_during_walk)
{
    add_basic_site();
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    const Navigation& nav = site->get_navigation();

    Render_Context context = site->make_render_context(&memory);
    Page_Walk walk = site->walk_pages(context);

    const Page* home = walk.next();
    ASSERT_NE(nullptr, home);
    EXPECT_EQ(u8"/"sv, context.url.get_base_path());
    EXPECT_EQ(u8"."sv, context.page_url(*home));
    EXPECT_EQ(u8"api/overview/"sv, context.page_url(nav.pages[2]));

    const Page* about = walk.next();
    ASSERT_NE(nullptr, about);
    EXPECT_EQ(u8"/about"sv, context.url.get_base_path());
    EXPECT_EQ(u8"../api/overview/"sv, context.page_url(nav.pages[2]));

    const Page* overview = walk.next();
    ASSERT_NE(nullptr, overview);
    EXPECT_EQ(u8"../../about/"sv, context.page_url(nav.pages[1]));
    EXPECT_EQ(u8"../ref/"sv, context.page_url(nav.pages[3]));
    EXPECT_EQ(u8"api"sv, context.file.get_base_path());
    EXPECT_EQ(u8"api/ref.md"sv, context.file.make_absolute(u8"ref.md"));
    EXPECT_EQ(u8"about.md"sv, context.file.make_absolute(u8"../about.md"));

    ASSERT_NE(nullptr, walk.next());
    EXPECT_EQ(nullptr, walk.next());
    EXPECT_FALSE(context.current_page);
    EXPECT_EQ(nullptr, walk.next());
}

TEST_F(Site_Navigation_Test, absolute_urls)
{
    add_basic_site();
    const Result<Site_Navigation, Navigation_Error> site = build({
        .site_url = u8"https://example.com/docs/",
        .use_directory_urls = true,
        .use_absolute_urls = true,
    });
    ASSERT_TRUE(site);
    const Navigation& nav = site->get_navigation();

    Render_Context context = site->make_render_context(&memory);
    Page_Walk walk = site->walk_pages(context);
    ASSERT_NE(nullptr, walk.next());
    ASSERT_NE(nullptr, walk.next());

    EXPECT_EQ(u8"https://example.com/docs/"sv, context.page_url(nav.pages[0]));
    EXPECT_EQ(u8"https://example.com/docs/about/"sv, context.page_url(nav.pages[1]));
    EXPECT_EQ(u8"https://example.com/docs/api/ref/"sv, context.page_url(nav.pages[3]));
}

TEST_F(Site_Navigation_Test, independent_contexts)
{
    add_basic_site();
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);

    Render_Context first = site->make_render_context(&memory);
    Render_Context second = site->make_render_context(&memory);
    Page_Walk first_walk = site->walk_pages(first);
    Page_Walk second_walk = site->walk_pages(second);

    ASSERT_NE(nullptr, first_walk.next());
    ASSERT_NE(nullptr, first_walk.next());
    ASSERT_NE(nullptr, second_walk.next());

    EXPECT_EQ(Page_Index { 1 }, first.current_page);
    EXPECT_EQ(Page_Index { 0 }, second.current_page);
    EXPECT_EQ(u8"about.md"sv, first.file.get_current_path());
    EXPECT_EQ(u8"index.md"sv, second.file.get_current_path());
}

} // namespace
} // namespace sitenav
