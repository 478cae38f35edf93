#ifndef SITENAV_FILE_CONTEXT_HPP
#define SITENAV_FILE_CONTEXT_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "sitenav/fwd.hpp"

namespace sitenav {

/// @brief Resolves references between source documents
/// relative to the document currently being rendered.
///
/// This is used to check that relative links within a document point to
/// documents that are part of the navigation.
struct File_Context {
private:
    std::pmr::u8string m_current_path;
    std::pmr::u8string m_base_path;

public:
    [[nodiscard]]
    explicit File_Context(std::pmr::memory_resource* memory)
        : m_current_path { memory }
        , m_base_path { memory }
    {
    }

    /// @brief Makes `path` the current document.
    void set_current_path(std::u8string_view path);

    /// @brief Returns the path of the current document, or an empty string if there is none.
    [[nodiscard]]
    std::u8string_view get_current_path() const
    {
        return m_current_path;
    }

    /// @brief Returns the directory of the current document.
    /// This is empty if there is no current document or if it is in the root directory.
    [[nodiscard]]
    std::u8string_view get_base_path() const
    {
        return m_base_path;
    }

    /// @brief Appends the normalized path of `path`,
    /// which is relative to the directory of the current document.
    /// The result is relative to the documentation directory.
    void make_absolute(std::pmr::u8string& out, std::u8string_view path) const;

    [[nodiscard]]
    std::pmr::u8string make_absolute(std::u8string_view path) const
    {
        std::pmr::u8string result { m_base_path.get_allocator() };
        make_absolute(result, path);
        return result;
    }
};

} // namespace sitenav

#endif
