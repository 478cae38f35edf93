#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "sitenav/util/posix_path.hpp"
#include "sitenav/util/strings.hpp"

#include "sitenav/url_context.hpp"

namespace sitenav {
namespace {

using namespace std::literals;

/// @brief Resolves `relative` against the directory `base`,
/// the way a browser would resolve a link on a page in that directory.
std::pmr::u8string
resolve(std::u8string_view base, std::u8string_view relative, std::pmr::memory_resource* memory)
{
    std::pmr::u8string joined { memory };
    posix::join(joined, base, relative);
    std::pmr::u8string result { memory };
    posix::normalize(result, joined);
    if (relative.ends_with(u8'/') && result != u8"/") {
        result += u8'/';
    }
    return result;
}

struct URL_Context_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    URL_Context relative_context { u8"", false, &memory };
    URL_Context absolute_context { u8"https://example.com/docs/", true, &memory };

    std::pmr::u8string relative(std::u8string_view url) const
    {
        return relative_context.make_relative(url);
    }
};

TEST_F(URL_Context_Test, initial_base_is_root)
{
    EXPECT_EQ(u8"/"sv, relative_context.get_base_path());
}

TEST_F(URL_Context_Test, from_root)
{
    EXPECT_EQ(u8"."sv, relative(u8"/"));
    EXPECT_EQ(u8"about/"sv, relative(u8"/about/"));
    EXPECT_EQ(u8"api/ref/"sv, relative(u8"/api/ref/"));
    EXPECT_EQ(u8"about.html"sv, relative(u8"/about.html"));
}

TEST_F(URL_Context_Test, from_directory_url)
{
    relative_context.set_current_url(u8"/about/");
    EXPECT_EQ(u8"/about"sv, relative_context.get_base_path());

    EXPECT_EQ(u8".."sv, relative(u8"/"));
    EXPECT_EQ(u8"./"sv, relative(u8"/about/"));
    EXPECT_EQ(u8"../api/ref/"sv, relative(u8"/api/ref/"));
}

TEST_F(URL_Context_Test, from_nested_directory_url)
{
    relative_context.set_current_url(u8"/api/overview/");

    EXPECT_EQ(u8"../ref/"sv, relative(u8"/api/ref/"));
    EXPECT_EQ(u8"../"sv, relative(u8"/api/"));
    EXPECT_EQ(u8"../../about/"sv, relative(u8"/about/"));
    EXPECT_EQ(u8"../.."sv, relative(u8"/"));
}

TEST_F(URL_Context_Test, from_flat_url)
{
    relative_context.set_current_url(u8"/api/overview.html");
    EXPECT_EQ(u8"/api"sv, relative_context.get_base_path());

    EXPECT_EQ(u8"ref.html"sv, relative(u8"/api/ref.html"));
    EXPECT_EQ(u8"../index.html"sv, relative(u8"/index.html"));

    relative_context.set_current_url(u8"/about.html");
    EXPECT_EQ(u8"index.html"sv, relative(u8"/index.html"));
}

TEST_F(URL_Context_Test, absolute)
{
    EXPECT_EQ(u8"https://example.com/docs/"sv, absolute_context.make_relative(u8"/"));
    EXPECT_EQ(u8"https://example.com/docs/about/"sv, absolute_context.make_relative(u8"/about/"));

    absolute_context.set_current_url(u8"/api/overview/");
    EXPECT_EQ(
        u8"https://example.com/docs/api/ref/"sv, absolute_context.make_relative(u8"/api/ref/")
    );
}

TEST_F(URL_Context_Test, make_relative_appends)
{
    std::pmr::u8string out { u8"href=", &memory };
    relative_context.make_relative(out, u8"/about/");
    EXPECT_EQ(u8"href=about/"sv, out);
}

TEST_F(URL_Context_Test, relative_urls_resolve_to_target)
{
    constexpr std::u8string_view current_urls[] {
        u8"/", u8"/about/", u8"/api/", u8"/api/overview/", u8"/api/overview.html", u8"/a/b/c/",
    };
    constexpr std::u8string_view targets[] {
        u8"/",        u8"/about/",      u8"/api/",          u8"/api/overview/",
        u8"/api/ref/", u8"/index.html", u8"/api/ref.html", u8"/a/b/d/",
    };

    for (const std::u8string_view current : current_urls) {
        relative_context.set_current_url(current);
        const std::u8string_view base = relative_context.get_base_path();
        for (const std::u8string_view target : targets) {
            const std::pmr::u8string link = relative(target);
            EXPECT_EQ(target, resolve(base, link, &memory))
                << "link \"" << as_string_view(link) << "\" from " << as_string_view(current);
        }
    }
}

} // namespace
} // namespace sitenav
