#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sitenav/util/posix_path.hpp"
#include "sitenav/util/strings.hpp"

namespace sitenav::posix {
namespace {

/// @brief Appends the non-empty components of `path` to `out`.
void split_components(std::pmr::vector<std::u8string_view>& out, std::u8string_view path)
{
    while (!path.empty()) {
        const Split_Result parts = split_first(path, separator);
        if (!parts.head.empty()) {
            out.push_back(parts.head);
        }
        path = parts.tail;
    }
}

void append_joined(std::pmr::u8string& out, std::span<const std::u8string_view> components)
{
    bool first = true;
    for (const std::u8string_view c : components) {
        if (!first) {
            out += separator;
        }
        out += c;
        first = false;
    }
}

} // namespace

std::u8string_view dirname(std::u8string_view path)
{
    const std::size_t last = path.rfind(separator);
    if (last == std::u8string_view::npos) {
        return {};
    }
    const std::u8string_view head = path.substr(0, last + 1);
    const std::u8string_view trimmed = trim_right(head, separator);
    // "/" and "//" are their own directory.
    return trimmed.empty() ? head : trimmed;
}

std::u8string_view basename(std::u8string_view path)
{
    const std::size_t last = path.rfind(separator);
    return last == std::u8string_view::npos ? path : path.substr(last + 1);
}

Extension_Split split_extension(std::u8string_view path)
{
    const std::size_t last_separator = path.rfind(separator);
    const std::size_t name_begin = last_separator == std::u8string_view::npos ? 0 : last_separator + 1;
    const std::size_t dot = path.rfind(u8'.');
    if (dot == std::u8string_view::npos || dot < name_begin) {
        return { .root = path, .extension = {} };
    }
    for (std::size_t i = name_begin; i < dot; ++i) {
        if (path[i] != u8'.') {
            return { .root = path.substr(0, dot), .extension = path.substr(dot) };
        }
    }
    return { .root = path, .extension = {} };
}

void normalize(std::pmr::u8string& out, std::u8string_view path)
{
    if (path.empty()) {
        out += u8'.';
        return;
    }

    // POSIX allows implementations to treat exactly two leading slashes specially,
    // whereas three or more are equivalent to one.
    std::size_t initial_separators = path.starts_with(separator) ? 1 : 0;
    if (path.starts_with(u8"//") && !path.starts_with(u8"///")) {
        initial_separators = 2;
    }

    std::pmr::vector<std::u8string_view> components { out.get_allocator().resource() };
    std::pmr::vector<std::u8string_view> result { out.get_allocator().resource() };
    split_components(components, path);

    for (const std::u8string_view c : components) {
        if (c == u8".") {
            continue;
        }
        if (c != u8"..") {
            result.push_back(c);
            continue;
        }
        const bool can_collapse = !result.empty() && result.back() != u8"..";
        if (can_collapse) {
            result.pop_back();
        }
        else if (initial_separators == 0) {
            result.push_back(c);
        }
        // ".." at the root is the root itself.
    }

    const std::size_t initial_size = out.size();
    out.append(initial_separators, separator);
    append_joined(out, result);
    if (out.size() == initial_size) {
        out += u8'.';
    }
}

void join(std::pmr::u8string& out, std::u8string_view base, std::u8string_view path)
{
    if (is_absolute(path)) {
        out += path;
        return;
    }
    out += base;
    if (!base.empty() && !base.ends_with(separator)) {
        out += separator;
    }
    out += path;
}

void relative(std::pmr::u8string& out, std::u8string_view path, std::u8string_view start)
{
    std::pmr::memory_resource* const memory = out.get_allocator().resource();

    std::pmr::u8string normal_path { memory };
    std::pmr::u8string normal_start { memory };
    normalize(normal_path, path);
    normalize(normal_start, start);

    std::pmr::vector<std::u8string_view> path_components { memory };
    std::pmr::vector<std::u8string_view> start_components { memory };
    split_components(path_components, normal_path);
    split_components(start_components, normal_start);
    // Normalization leaves "." only for otherwise empty paths.
    std::erase(path_components, u8".");
    std::erase(start_components, u8".");

    const auto [start_mismatch, path_mismatch] = std::ranges::mismatch(start_components, path_components);
    const auto common = std::size_t(start_mismatch - start_components.begin());

    std::pmr::vector<std::u8string_view> result { memory };
    result.insert(result.end(), start_components.size() - common, u8"..");
    result.insert(result.end(), path_mismatch, path_components.end());

    if (result.empty()) {
        out += u8'.';
        return;
    }
    append_joined(out, result);
}

} // namespace sitenav::posix
