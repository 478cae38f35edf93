#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "sitenav/util/result.hpp"
#include "sitenav/util/strings.hpp"

#include "sitenav/diagnostic.hpp"
#include "sitenav/page_entry.hpp"
#include "sitenav/services.hpp"

namespace sitenav {

Result<Page_Entry, Entry_Error> parse_page_entry(
    std::span<const std::u8string_view> fields,
    Logger& logger,
    std::pmr::memory_resource* memory
)
{
    if (fields.empty() || fields.size() > max_entry_fields) {
        if (logger.can_log(Severity::error)) {
            std::pmr::u8string message { u8"Page entry contained ", memory };
            append_integer(message, fields.size());
            message += u8" fields. Expected 1, 2 or 3.";
            logger(Diagnostic { .severity = Severity::error,
                                .id = diagnostic::entry_malformed,
                                .message = message });
        }
        return Entry_Error::malformed;
    }

    if (fields[0].empty()) {
        logger.log(
            Severity::error, diagnostic::entry_path_missing, u8"Page entry has an empty path."
        );
        return Entry_Error::missing_path;
    }

    Page_Entry result {
        .path = std::pmr::u8string { fields[0], memory },
        .title = std::optional<std::pmr::u8string> {},
        .child_title = {},
    };
    if (fields.size() >= 2) {
        if (fields[1] == hidden_title_marker) {
            result.title = Hidden_Entry {};
        }
        else {
            result.title = std::optional<std::pmr::u8string> { std::in_place, fields[1], memory };
        }
    }
    if (fields.size() >= 3) {
        result.child_title.emplace(fields[2], memory);
    }
    return result;
}

} // namespace sitenav
