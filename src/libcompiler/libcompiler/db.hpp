#ifndef DULCE_LIBCOMPILER_DB
#define DULCE_LIBCOMPILER_DB

#include <libutl/utilities.hpp>
#include <libutl/index_vector.hpp>
#include <libutl/string_pool.hpp>
#include <libcompiler/ast/ast.hpp>
#include <libcompiler/fwd.hpp>
#include <libcompiler/lsp.hpp>

namespace du::db {

    enum struct Log_level : std::uint8_t { None, Debug };

    // Compiler configuration.
    struct Configuration {
        Log_level log_level = Log_level::None;
        bool      memoize   = true;
    };

    // Compiler database.
    struct Database {
        ast::Arena                   ast;
        utl::String_pool             string_pool;
        std::vector<lsp::Diagnostic> diagnostics;
        Configuration                config;
    };

    // Create a compiler database.
    [[nodiscard]] auto database(Configuration config) -> Database;

    // Add `diagnostic` to the database.
    void add_diagnostic(Database& db, lsp::Diagnostic diagnostic);

    // Add an error diagnostic to the database.
    void add_error(Database& db, lsp::Range range, std::string message);

    // Print every diagnostic to `stream`.
    void print_diagnostics(std::ostream& stream, Database const& db);

    // Whether debug logging is enabled.
    [[nodiscard]] auto is_debug(Database const& db) noexcept -> bool;

} // namespace du::db

#endif // DULCE_LIBCOMPILER_DB
