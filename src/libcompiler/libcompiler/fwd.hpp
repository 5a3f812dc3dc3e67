#ifndef DULCE_LIBCOMPILER_FWD
#define DULCE_LIBCOMPILER_FWD

#include <libutl/utilities.hpp>
#include <libutl/index_vector.hpp>

#define DEFINE_INDEX(name)                                 \
    struct name : utl::Vector_index<name, std::uint32_t> { \
        using Vector_index::Vector_index;                  \
    }

// NOLINTBEGIN(bugprone-forward-declaration-namespace)

namespace du::db {
    struct Database;
} // namespace du::db

namespace du::ast {
    struct Arena;
    struct Node;
    struct Variable;
    struct Scope;
    DEFINE_INDEX(Node_id);
    DEFINE_INDEX(Variable_id);
    DEFINE_INDEX(Scope_id);
} // namespace du::ast

namespace du::syn {
    struct Context;
    DEFINE_INDEX(Synth_id);
    DEFINE_INDEX(Method_call_kind_id);
} // namespace du::syn

// NOLINTEND(bugprone-forward-declaration-namespace)

#undef DEFINE_INDEX

#endif // DULCE_LIBCOMPILER_FWD
