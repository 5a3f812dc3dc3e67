#ifndef DULCE_LIBCOMPILER_COMPILER
#define DULCE_LIBCOMPILER_COMPILER

#include <libutl/utilities.hpp>
#include <libutl/index_vector.hpp>
#include <libutl/string_pool.hpp>
#include <libcompiler/lsp.hpp>

namespace du::db {

    // Identifier with a range.
    struct Name {
        utl::String_id id;
        lsp::Range     range;
    };

    struct Integer {
        std::int64_t value {};
    };

    struct String {
        utl::String_id id;
    };

    // Check whether `name` starts with a capital letter, possibly preceded by colons.
    auto is_constant_name(std::string_view name) -> bool;

} // namespace du::db

#endif // DULCE_LIBCOMPILER_COMPILER
