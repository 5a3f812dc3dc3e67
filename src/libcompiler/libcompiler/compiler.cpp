#include <libutl/utilities.hpp>
#include <libcompiler/db.hpp>

du::lsp::Range::Range(Position start, Position stop) : start { start }, stop { stop }
{
    assert(start <= stop);
}

auto du::lsp::to_range_0(Position position) noexcept -> Range
{
    return Range(position, position);
}

auto du::lsp::error(Range range, std::string message) -> Diagnostic
{
    return Diagnostic {
        .message      = std::move(message),
        .range        = range,
        .severity     = Severity::Error,
        .related_info = {},
    };
}

auto du::lsp::severity_string(Severity severity) -> std::string_view
{
    switch (severity) {
    case Severity::Error:       return "Error";
    case Severity::Warning:     return "Warning";
    case Severity::Hint:        return "Hint";
    case Severity::Information: return "Info";
    }
    cpputil::unreachable();
}

auto du::db::database(Configuration config) -> Database
{
    return Database {
        .ast         = {},
        .string_pool = {},
        .diagnostics = {},
        .config      = config,
    };
}

void du::db::add_diagnostic(Database& db, lsp::Diagnostic diagnostic)
{
    db.diagnostics.push_back(std::move(diagnostic));
}

void du::db::add_error(Database& db, lsp::Range range, std::string message)
{
    add_diagnostic(db, lsp::error(range, std::move(message)));
}

void du::db::print_diagnostics(std::ostream& stream, Database const& db)
{
    for (lsp::Diagnostic const& diag : db.diagnostics) {
        std::println(stream, "{} {}: {}", severity_string(diag.severity), diag.range, diag.message);
        for (lsp::Diagnostic_related const& related : diag.related_info) {
            std::println(stream, "    note {}: {}", related.range, related.message);
        }
    }
}

auto du::db::is_debug(Database const& db) noexcept -> bool
{
    return db.config.log_level == Log_level::Debug;
}

auto du::db::is_constant_name(std::string_view name) -> bool
{
    auto upper = [](char const c) { return 'A' <= c and c <= 'Z'; };
    auto index = name.find_first_not_of(':');
    return index != std::string_view::npos and upper(name.at(index));
}
