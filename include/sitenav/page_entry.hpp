#ifndef SITENAV_PAGE_ENTRY_HPP
#define SITENAV_PAGE_ENTRY_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "sitenav/util/result.hpp"

#include "sitenav/fwd.hpp"

namespace sitenav {

/// @brief The title which marks an entry as hidden in the raw, positional entry form.
/// It is only recognized by `parse_page_entry`.
inline constexpr std::u8string_view hidden_title_marker = u8"**HIDDEN**";

/// @brief The maximum number of fields in a raw page entry.
inline constexpr std::size_t max_entry_fields = 3;

/// @brief Marks a page which is excluded from the visible navigation tree,
/// but which still takes part in the flat page sequence and in previous/next links.
struct Hidden_Entry {
    [[nodiscard]]
    friend constexpr bool operator==(Hidden_Entry, Hidden_Entry)
        = default;
};

/// @brief The title of a page entry.
/// An empty optional means that the title is derived from the path.
using Entry_Title = std::variant<std::optional<std::pmr::u8string>, Hidden_Entry>;

/// @brief One user-specified line describing the place of a document in the navigation.
struct Page_Entry {
    /// @brief The path of the source document, relative to the documentation directory.
    std::pmr::u8string path;
    /// @brief The title of the entry, or `Hidden_Entry`.
    /// For grouped entries, this is the title of the enclosing header.
    Entry_Title title;
    /// @brief The title of the page within its header.
    /// If absent, it is derived from the second path segment, if any.
    std::optional<std::pmr::u8string> child_title;

    [[nodiscard]]
    bool is_hidden() const
    {
        return std::holds_alternative<Hidden_Entry>(title);
    }

    /// @brief Returns the explicit title, or null if the title is derived or the entry is hidden.
    [[nodiscard]]
    const std::pmr::u8string* explicit_title() const
    {
        const auto* const title_option = std::get_if<0>(&title);
        return title_option && *title_option ? &**title_option : nullptr;
    }
};

enum struct Entry_Error : Default_Underlying {
    /// @brief The entry has no fields, or more than three.
    malformed,
    /// @brief The path of the entry is empty.
    missing_path,
};

/// @brief Converts a raw, positional page entry into a `Page_Entry`.
/// `fields` consists of the path, the optional title, and the optional child title, in that order.
/// A title equal to `hidden_title_marker` produces a hidden entry.
/// Errors are also reported to `logger`.
[[nodiscard]]
Result<Page_Entry, Entry_Error> parse_page_entry(
    std::span<const std::u8string_view> fields,
    Logger& logger,
    std::pmr::memory_resource* memory
);

} // namespace sitenav

#endif
