#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/util/posix_path.hpp"
#include "sitenav/util/strings.hpp"

#include "sitenav/url_context.hpp"

namespace sitenav {

URL_Context::URL_Context(
    std::u8string_view site_path,
    bool use_absolute_urls,
    std::pmr::memory_resource* memory
)
    : m_site_path { site_path, memory }
    , m_base_path { u8"/", memory }
    , m_use_absolute_urls { use_absolute_urls }
{
}

void URL_Context::set_current_url(std::u8string_view url)
{
    m_base_path = posix::dirname(url);
}

void URL_Context::make_relative(std::pmr::u8string& out, std::u8string_view url) const
{
    if (m_use_absolute_urls) {
        out += m_site_path;
        out += trim_left(url, posix::separator);
        return;
    }

    if (m_base_path == u8"/") {
        if (url == u8"/") {
            out += u8'.';
            return;
        }
        out += trim_left(url, posix::separator);
        return;
    }

    posix::relative(out, url, m_base_path);
    if (url.size() > 1 && url.ends_with(posix::separator)) {
        out += posix::separator;
    }
}

} // namespace sitenav
