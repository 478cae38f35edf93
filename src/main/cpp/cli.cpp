#include <cstdlib>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "sitenav/util/result.hpp"
#include "sitenav/util/strings.hpp"
#include "sitenav/util/tty.hpp"

#include "sitenav/diagnostic.hpp"
#include "sitenav/fwd.hpp"
#include "sitenav/navigation.hpp"
#include "sitenav/page_entry.hpp"
#include "sitenav/print.hpp"
#include "sitenav/services.hpp"
#include "sitenav/site_navigation.hpp"

namespace sitenav {
namespace {

/// @brief Separates the fields of an entry given on the command line.
constexpr char8_t entry_field_separator = u8'|';

struct Stderr_Logger final : Logger {
    std::pmr::u8string out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(Severity min_severity, std::pmr::memory_resource* memory)
        : Logger { min_severity }
        , out { memory }
    {
    }

    void operator()(const Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;
        print_diagnostic(out, diagnostic, is_stderr_tty);
        print_stderr(out);
        out.clear();
    }
};

/// @brief Splits an entry like `api/ref.md|API|Reference` into its fields.
void split_entry_fields(std::pmr::vector<std::u8string_view>& out, std::u8string_view entry)
{
    while (true) {
        const Split_Result parts = split_first(entry, entry_field_separator);
        out.push_back(parts.head);
        if (!parts.found) {
            return;
        }
        entry = parts.tail;
    }
}

void print_link(
    std::pmr::u8string& out,
    std::u8string_view label,
    const Navigation& navigation,
    std::optional<Page_Index> target,
    const Render_Context& context
)
{
    out += label;
    if (!target) {
        out += u8"-";
        return;
    }
    context.append_page_url(out, navigation.page(*target));
}

void print_walk(const Site_Navigation& site, std::pmr::memory_resource* memory)
{
    const Navigation& navigation = site.get_navigation();
    Render_Context context = site.make_render_context(memory);
    std::pmr::u8string out { memory };

    for (const Page& page : site.walk_pages(context)) {
        out += page.has_title() ? std::u8string_view { page.title } : blank_title;
        if (page.hidden) {
            out += u8" (hidden)";
        }
        out += u8": ";
        context.append_page_url(out, page);
        out += u8" -> ";
        out += page.output_path;
        print_link(out, u8" prev=", navigation, page.previous_page, context);
        print_link(out, u8" next=", navigation, page.next_page, context);
        out += u8'\n';
        print_stdout(out);
        out.clear();
    }
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser {
        "Builds the navigation of a documentation site from a list of page entries.",
        "Each entry has the form PATH, PATH|TITLE, or PATH|TITLE|CHILD_TITLE. "
        "A TITLE of **HIDDEN** excludes the page from the navigation tree.",
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::PositionalList<std::string> entries_arg {
        parser,
        "entries",
        "Page entries, in navigation order",
        args::Options::Required,
    };
    args::ValueFlag<std::string> site_url_arg {
        parser, "url", "Site URL, used as the prefix of absolute URLs", { 'u', "site-url" }, ""
    };
    args::Flag flat_urls_arg {
        parser, "flat-urls", "Generate name.html instead of name/index.html", { "flat-urls" }
    };
    args::Flag absolute_urls_arg {
        parser, "absolute-urls", "Prefix URLs with the site URL", { "absolute-urls" }
    };
    args::Flag walk_arg {
        parser, "walk", "Print every page as seen during rendering", { 'w', "walk" }
    };
    args::Flag sources_arg {
        parser, "sources", "Print the set of source documents", { 's', "sources" }
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    std::pmr::unsynchronized_pool_resource memory;
    Stderr_Logger logger { severity_arg.Get(), &memory };

    std::pmr::vector<Page_Entry> entries { &memory };
    std::pmr::vector<std::u8string_view> fields { &memory };
    for (const std::string& raw : entries_arg.Get()) {
        fields.clear();
        split_entry_fields(fields, as_u8string_view(raw));
        Result<Page_Entry, Entry_Error> entry = parse_page_entry(fields, logger, &memory);
        if (!entry) {
            return EXIT_FAILURE;
        }
        entries.push_back(std::move(*entry));
    }

    const std::string site_url = site_url_arg.Get();
    const Navigation_Options options {
        .site_url = as_u8string_view(site_url),
        .use_directory_urls = !flat_urls_arg.Matched(),
        .use_absolute_urls = absolute_urls_arg.Matched(),
    };

    const Result<Site_Navigation, Navigation_Error> site
        = Site_Navigation::build(entries, options, logger, &memory);
    if (!site) {
        return EXIT_FAILURE;
    }

    {
        const Render_Context context = site->make_render_context(&memory);
        std::pmr::u8string out { &memory };
        print_site_navigation(out, site->get_navigation(), context);
        print_stdout(out);
    }

    if (walk_arg.Matched()) {
        print_stdout(u8"\n");
        print_walk(*site, &memory);
    }

    if (sources_arg.Matched()) {
        std::pmr::vector<std::u8string_view> sources { &memory };
        site->get_source_files(sources);
        std::pmr::u8string out { u8"\n", &memory };
        for (const std::u8string_view source : sources) {
            out += source;
            out += u8'\n';
        }
        print_stdout(out);
    }

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace sitenav

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return sitenav::main(argc, argv);
}
