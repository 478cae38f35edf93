#ifndef SITENAV_URL_CONTEXT_HPP
#define SITENAV_URL_CONTEXT_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/fwd.hpp"

namespace sitenav {

/// @brief Computes the URLs of pages as seen from the page currently being rendered.
///
/// Relative URLs allow a generated site to be deployed under any path on a host
/// without knowing that path in advance.
/// Absolute URLs are prefixed with the site URL instead,
/// which is useful when the server rewrites request paths.
struct URL_Context {
private:
    std::pmr::u8string m_site_path;
    std::pmr::u8string m_base_path;
    bool m_use_absolute_urls;

public:
    [[nodiscard]]
    explicit URL_Context(
        std::u8string_view site_path,
        bool use_absolute_urls,
        std::pmr::memory_resource* memory
    );

    /// @brief Makes `url` the current URL.
    /// Subsequent relative URLs are relative to the directory of `url`.
    void set_current_url(std::u8string_view url);

    /// @brief Returns the directory of the current URL, which is initially `/`.
    [[nodiscard]]
    std::u8string_view get_base_path() const
    {
        return m_base_path;
    }

    /// @brief Appends `url`, which is an absolute URL path like `/about/`,
    /// as seen from the current URL.
    /// In absolute mode, this is the site path followed by `url` without its leading `/`.
    /// Otherwise, this is a relative URL which keeps the trailing `/` of `url`,
    /// or `.` if both the current directory and `url` are the root.
    void make_relative(std::pmr::u8string& out, std::u8string_view url) const;

    [[nodiscard]]
    std::pmr::u8string make_relative(std::u8string_view url) const
    {
        std::pmr::u8string result { m_base_path.get_allocator() };
        make_relative(result, url);
        return result;
    }
};

} // namespace sitenav

#endif
