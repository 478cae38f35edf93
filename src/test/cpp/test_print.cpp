#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>

#include "sitenav/util/ansi.hpp"
#include "sitenav/util/result.hpp"

#include "sitenav/diagnostic.hpp"
#include "sitenav/navigation.hpp"
#include "sitenav/print.hpp"
#include "sitenav/site_navigation.hpp"

#include "entries.hpp"

namespace sitenav {
namespace {

using namespace std::literals;

struct Print_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Entry_List list { &memory };
    std::pmr::u8string out { &memory };

    Result<Site_Navigation, Navigation_Error> build()
    {
        list({ u8"index.md" })({ u8"about.md", u8"About" })
            ({ u8"api/overview.md", u8"API", u8"Overview" })
            ({ u8"api/ref.md", u8"API", u8"Reference" });
        return Site_Navigation::build(list.get(), {}, ignorant_logger, &memory);
    }
};

TEST_F(Print_Test, nothing_active)
{
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    const Render_Context context = site->make_render_context(&memory);
    print_site_navigation(out, site->get_navigation(), context);

    constexpr std::u8string_view expected = u8"Home - /\n"
                                            u8"About - /about/\n"
                                            u8"API\n"
                                            u8"    Overview - /api/overview/\n"
                                            u8"    Reference - /api/ref/\n";
    EXPECT_EQ(expected, out);
}

TEST_F(Print_Test, homepage_active)
{
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    Render_Context context = site->make_render_context(&memory);
    Page_Walk walk = site->walk_pages(context);
    ASSERT_NE(nullptr, walk.next());
    print_site_navigation(out, site->get_navigation(), context);

    constexpr std::u8string_view expected = u8"Home - / [*]\n"
                                            u8"About - /about/\n"
                                            u8"API\n"
                                            u8"    Overview - /api/overview/\n"
                                            u8"    Reference - /api/ref/\n";
    EXPECT_EQ(expected, out);
}

TEST_F(Print_Test, grouped_page_active)
{
    const Result<Site_Navigation, Navigation_Error> site = build();
    ASSERT_TRUE(site);
    Render_Context context = site->make_render_context(&memory);
    Page_Walk walk = site->walk_pages(context);
    ASSERT_NE(nullptr, walk.next());
    ASSERT_NE(nullptr, walk.next());
    ASSERT_NE(nullptr, walk.next());
    print_site_navigation(out, site->get_navigation(), context);

    constexpr std::u8string_view expected = u8"Home - /\n"
                                            u8"About - /about/\n"
                                            u8"API [*]\n"
                                            u8"    Overview - /api/overview/ [*]\n"
                                            u8"    Reference - /api/ref/\n";
    EXPECT_EQ(expected, out);
}

TEST_F(Print_Test, blank_page)
{
    const Page page {
        .title = std::pmr::u8string { &memory },
        .input_path = std::pmr::u8string { u8"a.md", &memory },
        .output_path = std::pmr::u8string { u8"a/index.html", &memory },
        .absolute_url = std::pmr::u8string { u8"/a/", &memory },
        .hidden = false,
        .previous_page = {},
        .next_page = {},
        .ancestors = std::pmr::vector<Header_Index> { &memory },
    };
    print_page(out, page, false, 2);
    EXPECT_EQ(u8"        [blank] - /a/\n"sv, out);
}

TEST_F(Print_Test, diagnostic)
{
    const Diagnostic d { .severity = Severity::warning,
                         .id = diagnostic::nav_page_duplicate,
                         .message = u8"The document \"a.md\" is listed more than once." };
    print_diagnostic(out, d, false);
    EXPECT_EQ(
        u8"WARNING: The document \"a.md\" is listed more than once. [nav.page.duplicate]\n"sv, out
    );
}

TEST_F(Print_Test, diagnostic_colored)
{
    const Diagnostic d { .severity = Severity::error,
                         .id = diagnostic::entry_path_missing,
                         .message = u8"Page entry has an empty path." };
    print_diagnostic(out, d, true);
    const std::u8string_view result = out;
    EXPECT_TRUE(result.starts_with(ansi::h_red));
    EXPECT_NE(std::u8string_view::npos, result.find(u8"ERROR"));
    EXPECT_NE(std::u8string_view::npos, result.find(u8"[entry.path.missing]"));
    EXPECT_TRUE(result.ends_with(u8'\n'));
}

} // namespace
} // namespace sitenav
