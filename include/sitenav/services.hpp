#ifndef SITENAV_SERVICES_HPP
#define SITENAV_SERVICES_HPP

#include <memory_resource>
#include <string_view>

#include "sitenav/util/assert.hpp"
#include "sitenav/util/severity.hpp"

#include "sitenav/diagnostic.hpp"
#include "sitenav/fwd.hpp"

namespace sitenav {

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        SITENAV_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Emits a diagnostic with the given parts if `can_log(severity)` is `true`.
    /// Callers that need to compose an expensive message should check `can_log` first.
    void log(Severity severity, std::u8string_view id, std::u8string_view message)
    {
        if (can_log(severity)) {
            (*this)(Diagnostic { .severity = severity, .id = id, .message = message });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace sitenav

#endif
