#include <memory_resource>
#include <string_view>
#include <variant>

#include <gtest/gtest.h>

#include "sitenav/util/result.hpp"

#include "sitenav/collecting_logger.hpp"
#include "sitenav/diagnostic.hpp"
#include "sitenav/page_entry.hpp"

namespace sitenav {
namespace {

using namespace std::literals;

struct Page_Entry_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };

    Result<Page_Entry, Entry_Error> parse(std::span<const std::u8string_view> fields)
    {
        return parse_page_entry(fields, logger, &memory);
    }
};

TEST_F(Page_Entry_Test, path_only)
{
    constexpr std::u8string_view fields[] { u8"about.md" };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_TRUE(entry);
    EXPECT_EQ(u8"about.md"sv, entry->path);
    EXPECT_FALSE(entry->is_hidden());
    EXPECT_EQ(nullptr, entry->explicit_title());
    EXPECT_FALSE(entry->child_title);
    EXPECT_TRUE(logger.nothing_logged());
}

TEST_F(Page_Entry_Test, title)
{
    constexpr std::u8string_view fields[] { u8"about.md", u8"About us" };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_TRUE(entry);
    ASSERT_NE(nullptr, entry->explicit_title());
    EXPECT_EQ(u8"About us"sv, *entry->explicit_title());
    EXPECT_FALSE(entry->child_title);
}

TEST_F(Page_Entry_Test, child_title)
{
    constexpr std::u8string_view fields[] { u8"api/ref.md", u8"API", u8"Reference" };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_TRUE(entry);
    ASSERT_NE(nullptr, entry->explicit_title());
    EXPECT_EQ(u8"API"sv, *entry->explicit_title());
    ASSERT_TRUE(entry->child_title);
    EXPECT_EQ(u8"Reference"sv, *entry->child_title);
}

TEST_F(Page_Entry_Test, hidden_marker)
{
    constexpr std::u8string_view fields[] { u8"secret.md", hidden_title_marker };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_TRUE(entry);
    EXPECT_TRUE(entry->is_hidden());
    EXPECT_TRUE(std::holds_alternative<Hidden_Entry>(entry->title));
    EXPECT_EQ(nullptr, entry->explicit_title());
}

TEST_F(Page_Entry_Test, hidden_marker_only_exact)
{
    constexpr std::u8string_view fields[] { u8"secret.md", u8"**hidden**" };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_TRUE(entry);
    EXPECT_FALSE(entry->is_hidden());
}

TEST_F(Page_Entry_Test, too_many_fields)
{
    constexpr std::u8string_view fields[] { u8"a.md", u8"A", u8"B", u8"C" };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_FALSE(entry);
    EXPECT_EQ(Entry_Error::malformed, entry.error());
    ASSERT_EQ(1u, logger.diagnostics.size());
    EXPECT_EQ(diagnostic::entry_malformed, logger.diagnostics[0].id);
    EXPECT_EQ(Severity::error, logger.diagnostics[0].severity);
    EXPECT_NE(std::u8string_view::npos, logger.diagnostics[0].message.find(u8"4 fields"));
}

TEST_F(Page_Entry_Test, no_fields)
{
    const Result<Page_Entry, Entry_Error> entry = parse({});
    ASSERT_FALSE(entry);
    EXPECT_EQ(Entry_Error::malformed, entry.error());
    EXPECT_TRUE(logger.was_logged(diagnostic::entry_malformed));
}

TEST_F(Page_Entry_Test, empty_path)
{
    constexpr std::u8string_view fields[] { u8"", u8"Title" };
    const Result<Page_Entry, Entry_Error> entry = parse(fields);
    ASSERT_FALSE(entry);
    EXPECT_EQ(Entry_Error::missing_path, entry.error());
    EXPECT_TRUE(logger.was_logged(diagnostic::entry_path_missing));
}

} // namespace
} // namespace sitenav
