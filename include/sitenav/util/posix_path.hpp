#ifndef SITENAV_POSIX_PATH_HPP
#define SITENAV_POSIX_PATH_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/fwd.hpp"

/// @brief Lexical operations on `/`-separated paths.
/// None of these functions access the file system,
/// and all of them treat URL paths and document paths alike.
namespace sitenav::posix {

inline constexpr char8_t separator = u8'/';

/// @brief Returns the directory component of `path`,
/// i.e. everything up to the last separator, with trailing separators removed
/// unless the directory is the root itself.
/// For example, `dirname("a/b/c.md")` is `"a/b"`,
/// `dirname("/about/")` is `"/about"`, `dirname("/x")` is `"/"`, and `dirname("x")` is empty.
[[nodiscard]]
std::u8string_view dirname(std::u8string_view path);

/// @brief Returns the final component of `path`, i.e. everything past the last separator.
/// This is empty if `path` ends with a separator.
[[nodiscard]]
std::u8string_view basename(std::u8string_view path);

struct Extension_Split {
    /// @brief Everything preceding the extension.
    std::u8string_view root;
    /// @brief The extension including the leading `.`, or empty.
    std::u8string_view extension;
};

/// @brief Splits `path` into a root and an extension.
/// Leading dots of the final component do not start an extension,
/// so `".profile"` has no extension.
[[nodiscard]]
Extension_Split split_extension(std::u8string_view path);

/// @brief Returns `true` if `path` begins with a separator.
[[nodiscard]]
constexpr bool is_absolute(std::u8string_view path)
{
    return path.starts_with(separator);
}

/// @brief Appends the normalized form of `path` to `out`.
/// Redundant separators and `.` components are removed,
/// and `..` components are collapsed against preceding components where possible.
/// An empty result is written as `"."`.
void normalize(std::pmr::u8string& out, std::u8string_view path);

/// @brief Appends `base` and `path` joined by a separator to `out`.
/// If `path` is absolute, `base` is discarded.
void join(std::pmr::u8string& out, std::u8string_view base, std::u8string_view path);

/// @brief Appends the path of `path` relative to the directory `start` to `out`.
/// Both paths are normalized first;
/// relative inputs are interpreted relative to a common root.
/// If both refer to the same location, the result is `"."`.
void relative(std::pmr::u8string& out, std::u8string_view path, std::u8string_view start);

} // namespace sitenav::posix

#endif
