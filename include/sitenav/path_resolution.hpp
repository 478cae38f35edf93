#ifndef SITENAV_PATH_RESOLUTION_HPP
#define SITENAV_PATH_RESOLUTION_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/fwd.hpp"

namespace sitenav {

/// @brief The stem which identifies index documents, such as `index.md`.
inline constexpr std::u8string_view index_stem = u8"index";

/// @brief The title given to the homepage when no explicit title is provided.
inline constexpr std::u8string_view homepage_title = u8"Home";

/// @brief Returns `true` if the source document at `path` is an index document
/// of some directory, such as `index.md` or `api/index.md`.
[[nodiscard]]
bool is_index_document(std::u8string_view path);

/// @brief Returns `true` if the source document at `path` is the homepage,
/// i.e. an index document in the root of the documentation directory.
/// `path` is normalized first, so `./index.md` is also the homepage.
/// @param memory used for the normalized path
[[nodiscard]]
bool is_homepage(std::u8string_view path, std::pmr::memory_resource* memory);

/// @brief Like `is_homepage(path, memory)`,
/// but normalizes into a small stack buffer instead.
[[nodiscard]]
bool is_homepage(std::u8string_view path);

/// @brief Appends the path of the HTML file generated for the source document at `path`.
/// Index documents map to `index.html` in the same directory.
/// Other documents map to `dir/name/index.html` if `use_directory_urls` is `true`,
/// and to `dir/name.html` otherwise.
void append_output_path(std::pmr::u8string& out, std::u8string_view path, bool use_directory_urls);

/// @brief Appends the canonical, absolute URL path of the source document at `path`.
/// The result always begins with `/`.
/// With `use_directory_urls`, any trailing `index.html` is dropped,
/// so that the URL refers to the directory, like `/` or `/dir/name/`.
/// Otherwise, the URL refers to the output file, like `/dir/name.html`.
void append_url_path(std::pmr::u8string& out, std::u8string_view path, bool use_directory_urls);

/// @brief Appends a human-readable title derived from a single path segment.
/// The homepage is titled `"Home"`.
/// Otherwise, the extension is stripped, `-` and `_` are replaced with spaces,
/// and the first letter is capitalized if the result contained no upper-case letters.
/// Only ASCII letters are considered, so `émile.md` is titled `émile`, not `Émile`.
void append_filename_title(std::pmr::u8string& out, std::u8string_view filename);

} // namespace sitenav

#endif
