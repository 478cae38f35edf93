#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/util/chars.hpp"
#include "sitenav/util/posix_path.hpp"
#include "sitenav/util/strings.hpp"

#include "sitenav/path_resolution.hpp"

namespace sitenav {
namespace {

constexpr std::u8string_view index_html = u8"index.html";
constexpr std::u8string_view html_extension = u8".html";

} // namespace

bool is_index_document(std::u8string_view path)
{
    return posix::split_extension(posix::basename(path)).root == index_stem;
}

bool is_homepage(std::u8string_view path, std::pmr::memory_resource* memory)
{
    std::pmr::u8string normalized { memory };
    posix::normalize(normalized, path);
    return posix::split_extension(normalized).root == index_stem;
}

bool is_homepage(std::u8string_view path)
{
    std::byte buffer[512];
    std::pmr::monotonic_buffer_resource memory { buffer, sizeof(buffer) };
    return is_homepage(path, &memory);
}

void append_output_path(std::pmr::u8string& out, std::u8string_view path, bool use_directory_urls)
{
    const std::u8string_view root = posix::split_extension(path).root;
    out += root;
    if (is_index_document(path) || !use_directory_urls) {
        out += html_extension;
        return;
    }
    out += posix::separator;
    out += index_html;
}

void append_url_path(std::pmr::u8string& out, std::u8string_view path, bool use_directory_urls)
{
    const std::size_t initial_size = out.size();
    out += posix::separator;
    append_output_path(out, trim_left(path, posix::separator), use_directory_urls);
    if (use_directory_urls && std::u8string_view { out }.substr(initial_size).ends_with(index_html)) {
        out.resize(out.size() - index_html.size());
    }
}

void append_filename_title(std::pmr::u8string& out, std::u8string_view filename)
{
    if (is_homepage(filename)) {
        out += homepage_title;
        return;
    }

    const std::size_t initial_size = out.size();
    for (const char8_t c : posix::split_extension(filename).root) {
        out += c == u8'-' || c == u8'_' ? u8' ' : c;
    }

    const std::u8string_view title = std::u8string_view { out }.substr(initial_size);
    if (!title.empty() && is_ascii_lower_case(title)) {
        out[initial_size] = to_ascii_upper(out[initial_size]);
    }
}

} // namespace sitenav
