#ifndef SITENAV_RESULT_HPP
#define SITENAV_RESULT_HPP

#include <concepts>
#include <type_traits>
#include <utility>
#include <variant>

#include "sitenav/util/assert.hpp"

#include "sitenav/fwd.hpp"

namespace sitenav {

struct Success_Tag { };
inline constexpr Success_Tag success_tag;

/// @brief Holds either a value of type `T` or an error of type `E`.
/// Both alternatives are implicitly constructible,
/// so a function returning `Result<T, E>` can simply `return value;` or `return error;`.
/// `T` and `E` shall be different types.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>, "Value and error types must be distinct.");

    using value_type = T;
    using error_type = E;

private:
    std::variant<T, E> m_data;

public:
    [[nodiscard]]
    constexpr Result(const T& value)
        requires std::copy_constructible<T>
        : m_data { std::in_place_index<0>, value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_data { std::in_place_index<0>, std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::in_place_index<1>, error }
    {
    }

    template <typename... Args>
    [[nodiscard]]
    constexpr explicit Result(Success_Tag, Args&&... args)
        : m_data { std::in_place_index<0>, std::forward<Args>(args)... }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.index() == 0;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr T& value() &
    {
        SITENAV_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr const T& value() const&
    {
        SITENAV_ASSERT(has_value());
        return *std::get_if<0>(&m_data);
    }

    [[nodiscard]]
    constexpr T&& value() &&
    {
        SITENAV_ASSERT(has_value());
        return std::move(*std::get_if<0>(&m_data));
    }

    [[nodiscard]]
    constexpr const E& error() const
    {
        SITENAV_ASSERT(!has_value());
        return *std::get_if<1>(&m_data);
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        return std::move(*this).value();
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        return &value();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        return &value();
    }
};

} // namespace sitenav

#endif
