#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/util/posix_path.hpp"

#include "sitenav/file_context.hpp"

namespace sitenav {

void File_Context::set_current_path(std::u8string_view path)
{
    m_current_path = path;
    m_base_path = posix::dirname(path);
}

void File_Context::make_absolute(std::pmr::u8string& out, std::u8string_view path) const
{
    std::pmr::u8string joined { out.get_allocator() };
    posix::join(joined, m_base_path, path);
    posix::normalize(out, joined);
}

} // namespace sitenav
