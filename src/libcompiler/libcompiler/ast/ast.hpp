#ifndef DULCE_LIBCOMPILER_AST
#define DULCE_LIBCOMPILER_AST

#include <libutl/utilities.hpp>
#include <libcompiler/compiler.hpp>

/*

    The Abstract Syntax Tree (AST) is the parsed, immutable representation
    of a program. Every node knows its parent and its lexical scope. Nodes
    are addressed by child index, with the following fixed conventions:

        method call         0 = receiver, 1..n = arguments, n+1 = block
        identifier call     0 = receiver (always empty)
        binary operation    0 = left, 1 = right
        assignment          0 = left, 1 = right
        for loop            0 = pattern, 1 = iterable, 2 = body
        method, block       parameters first, then body statements
        sequences, literals by element index

    An empty receiver slot is how the implicit receiver of a call is
    represented. The synthesis engine fills such slots with virtual nodes.

*/

namespace du::ast {

    enum struct Binary_operator : std::uint8_t {
        Add,
        Sub,
        Mul,
        Div,
        Modulo,
        Exponent,
        Left_shift,
        Right_shift,
        Bitwise_and,
        Bitwise_or,
        Bitwise_xor,
        Logical_and,
        Logical_or,
    };

    enum struct Variable_kind : std::uint8_t { Local, Instance, Class, Global };

    enum struct Scope_kind : std::uint8_t { Toplevel, Module, Class, Method, Block };

    auto binary_operator_string(Binary_operator op) -> std::string_view;
    auto describe_variable_kind(Variable_kind kind) -> std::string_view;
    auto describe_scope_kind(Scope_kind kind) -> std::string_view;

    struct Variable {
        db::Name      name;
        Variable_kind kind {};
        Scope_id      scope;
    };

    using Variable_map = std::unordered_map<utl::String_id, Variable_id, utl::Hash_vector_index>;

    struct Scope {
        Variable_map            variables;
        std::optional<Node_id>  node;
        std::optional<Scope_id> parent;
        Scope_kind              kind {};
    };

    namespace node {
        struct Toplevel {
            std::vector<Node_id> statements;
            Scope_id             scope;
        };

        struct Module {
            db::Name             name;
            std::vector<Node_id> body;
            Scope_id             scope;
        };

        struct Class {
            db::Name             name;
            std::vector<Node_id> body;
            Scope_id             scope;
        };

        struct Method {
            db::Name             name;
            std::vector<Node_id> parameters;
            std::vector<Node_id> body;
            Scope_id             scope;
        };

        struct Block {
            std::vector<Node_id> parameters;
            std::vector<Node_id> body;
            Scope_id             scope;
        };

        struct Stmt_sequence {
            std::vector<Node_id> statements;
        };

        struct Simple_parameter {
            Node_id variable;
        };

        struct Identifier_call {
            db::Name name;
        };

        struct Method_call {
            std::optional<Node_id> receiver;
            db::Name               name;
            std::vector<Node_id>   arguments;
            std::optional<Node_id> block;
            bool                   scope_qualified {};
        };

        struct Assignment {
            Node_id left;
            Node_id right;
        };

        struct Assign_operation {
            Node_id         left;
            Node_id         right;
            Binary_operator op {};
            lsp::Range      operator_range;
        };

        struct Destructured_lhs {
            std::vector<Node_id> elements;
        };

        struct Splat {
            Node_id operand;
        };

        struct Array_literal {
            std::vector<Node_id> elements;
        };

        struct For_loop {
            Node_id pattern;
            Node_id iterable;
            Node_id body;
        };

        struct Binary_operation {
            Node_id         left;
            Node_id         right;
            Binary_operator op {};
        };

        struct Variable_access {
            Variable_id variable;
        };

        struct Self_access {};

        struct Constant_access {
            db::Name               name;
            std::optional<Node_id> scope;
        };
    } // namespace node

    struct Node_variant
        : std::variant<
              node::Toplevel,
              node::Module,
              node::Class,
              node::Method,
              node::Block,
              node::Stmt_sequence,
              node::Simple_parameter,
              node::Identifier_call,
              node::Method_call,
              node::Assignment,
              node::Assign_operation,
              node::Destructured_lhs,
              node::Splat,
              node::Array_literal,
              node::For_loop,
              node::Binary_operation,
              node::Variable_access,
              node::Self_access,
              node::Constant_access,
              db::Integer,
              db::String> {
        using variant::variant;
    };

    struct Node {
        Node_variant           variant;
        lsp::Range             range;
        Scope_id               scope;
        std::optional<Node_id> parent;
    };

    struct Arena {
        utl::Index_vector<Node_id, Node>         nodes;
        utl::Index_vector<Variable_id, Variable> variables;
        utl::Index_vector<Scope_id, Scope>       scopes;
    };

    // The child slots of `node_id`, in index order. Empty slots are `std::nullopt`.
    [[nodiscard]] auto child_slots(Arena const& arena, Node_id node_id)
        -> std::vector<std::optional<Node_id>>;

    // The syntactic child at `index`, if any.
    [[nodiscard]] auto child(Arena const& arena, Node_id node_id, std::int32_t index)
        -> std::optional<Node_id>;

    [[nodiscard]] auto parent(Arena const& arena, Node_id node_id) -> std::optional<Node_id>;

    // The index of `node_id` within its parent.
    [[nodiscard]] auto index_in_parent(Arena const& arena, Node_id node_id)
        -> std::optional<std::int32_t>;

    // Innermost lexical scope containing `node_id`.
    [[nodiscard]] auto enclosing_scope(Arena const& arena, Node_id node_id) -> Scope_id;

    // The scope introduced by `node_id`, if it introduces one.
    [[nodiscard]] auto introduced_scope(Arena const& arena, Node_id node_id)
        -> std::optional<Scope_id>;

    // Innermost scope that determines the meaning of `self`. Blocks are transparent.
    [[nodiscard]] auto self_scope(Arena const& arena, Scope_id scope_id) -> Scope_id;

    // Position of the splat element of a destructured left-hand side, if any.
    [[nodiscard]] auto rest_index(Arena const& arena, node::Destructured_lhs const& lhs)
        -> std::optional<std::size_t>;

    // Whether `node_id` is written to by a plain, destructuring, or for loop assignment.
    [[nodiscard]] auto is_assignment_target(Arena const& arena, Node_id node_id) -> bool;

    // Whether the method call has a receiver, explicit or implicit.
    [[nodiscard]] auto has_receiver(node::Method_call const& call) noexcept -> bool;

    // Short human readable description of a node.
    [[nodiscard]] auto describe(Arena const& arena, utl::String_pool const& pool, Node_id node_id)
        -> std::string;

    // Builds an arena. Nodes are constructed bottom-up, scopes top-down.
    class Builder {
        Arena&                m_arena;
        utl::String_pool&     m_pool;
        std::vector<Scope_id> m_scopes;
    public:
        Builder(Arena& arena, utl::String_pool& pool);

        explicit Builder(db::Database& db);

        [[nodiscard]] auto current_scope() const -> Scope_id;

        // Open a new scope nested in the current one.
        auto enter_scope(Scope_kind kind) -> Scope_id;

        [[nodiscard]] auto name(std::string_view string, lsp::Range range) -> db::Name;

        // Find or declare the variable named `string` of the given kind.
        [[nodiscard]] auto variable_id(std::string_view string, Variable_kind kind, lsp::Range range)
            -> Variable_id;

        [[nodiscard]] auto toplevel(std::vector<Node_id> statements, lsp::Range range) -> Node_id;
        [[nodiscard]] auto module_(db::Name name, std::vector<Node_id> body, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto class_(db::Name name, std::vector<Node_id> body, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto method(
            db::Name             name,
            std::vector<Node_id> parameters,
            std::vector<Node_id> body,
            lsp::Range           range) -> Node_id;
        [[nodiscard]] auto block(
            std::vector<Node_id> parameters, std::vector<Node_id> body, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto sequence(std::vector<Node_id> statements, lsp::Range range) -> Node_id;
        [[nodiscard]] auto parameter(std::string_view string, lsp::Range range) -> Node_id;
        [[nodiscard]] auto identifier_call(db::Name name, lsp::Range range) -> Node_id;
        [[nodiscard]] auto method_call(node::Method_call call, lsp::Range range) -> Node_id;
        [[nodiscard]] auto assignment(Node_id left, Node_id right, lsp::Range range) -> Node_id;
        [[nodiscard]] auto assign_operation(
            Binary_operator op,
            Node_id         left,
            Node_id         right,
            lsp::Range      operator_range,
            lsp::Range      range) -> Node_id;
        [[nodiscard]] auto destructured_lhs(std::vector<Node_id> elements, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto splat(Node_id operand, lsp::Range range) -> Node_id;
        [[nodiscard]] auto array_literal(std::vector<Node_id> elements, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto for_loop(Node_id pattern, Node_id iterable, Node_id body, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto binary(Binary_operator op, Node_id left, Node_id right, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto variable(std::string_view string, Variable_kind kind, lsp::Range range)
            -> Node_id;
        [[nodiscard]] auto self_access(lsp::Range range) -> Node_id;
        [[nodiscard]] auto constant(
            std::string_view string, std::optional<Node_id> scope, lsp::Range range) -> Node_id;
        [[nodiscard]] auto integer(std::int64_t value, lsp::Range range) -> Node_id;
        [[nodiscard]] auto string(std::string_view string, lsp::Range range) -> Node_id;
    private:
        auto push(Node_variant variant, lsp::Range range) -> Node_id;
        auto leave_scope(Scope_kind kind) -> Scope_id;
        auto lookup_local(utl::String_id id) const -> std::optional<Variable_id>;
        auto scope_for(Variable_kind kind) const -> Scope_id;
    };

} // namespace du::ast

#endif // DULCE_LIBCOMPILER_AST
