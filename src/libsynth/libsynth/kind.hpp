#ifndef DULCE_LIBSYNTH_KIND
#define DULCE_LIBSYNTH_KIND

#include <libutl/utilities.hpp>
#include <libcompiler/db.hpp>
#include <unordered_set>

/*

    Synthetic nodes are never allocated by the rules that describe them.
    A synthetic node is identified by its address: the node it hangs off,
    the child index it occupies, and its kind. Index -1 is reserved for the
    desugared form of the parent.

    Kinds are plain values. Two kinds compare equal when their tags and
    parameters are equal.

*/

namespace du::syn {

    // A real or synthetic node.
    struct Node : std::variant<ast::Node_id, Synth_id> {
        using variant::variant;
        auto operator==(Node const&) const -> bool = default;
    };

    // A fresh local variable, introduced by `introducer` at `slot`.
    struct Synth_variable {
        Node         introducer;
        std::int32_t slot {};

        auto operator==(Synth_variable const&) const -> bool = default;
    };

    // Smallest and largest value of a synthesizable integer literal.
    inline constexpr std::int64_t integer_literal_min = -1000;
    inline constexpr std::int64_t integer_literal_max = 1000;

    namespace kind {
        struct Binary {
            ast::Binary_operator op {};
            auto operator==(Binary const&) const -> bool = default;
        };

        struct Assign {
            auto operator==(Assign const&) const -> bool = default;
        };

        struct Brace_block {
            auto operator==(Brace_block const&) const -> bool = default;
        };

        struct Local_variable_access {
            std::variant<ast::Variable_id, Synth_variable> variable;
            auto operator==(Local_variable_access const&) const -> bool = default;
        };

        struct Instance_variable_access {
            ast::Variable_id variable;
            auto operator==(Instance_variable_access const&) const -> bool = default;
        };

        struct Class_variable_access {
            ast::Variable_id variable;
            auto operator==(Class_variable_access const&) const -> bool = default;
        };

        struct Global_variable_access {
            ast::Variable_id variable;
            auto operator==(Global_variable_access const&) const -> bool = default;
        };

        struct Self_access {
            ast::Scope_id self_scope;
            auto operator==(Self_access const&) const -> bool = default;
        };

        // Value within [integer_literal_min, integer_literal_max].
        struct Integer_literal {
            std::int64_t value {};
            auto operator==(Integer_literal const&) const -> bool = default;
        };

        struct Range_literal {
            bool inclusive {};
            auto operator==(Range_literal const&) const -> bool = default;
        };

        struct Method_call {
            Method_call_kind_id id;
            auto operator==(Method_call const&) const -> bool = default;
        };

        struct Stmt_sequence {
            auto operator==(Stmt_sequence const&) const -> bool = default;
        };

        struct Simple_parameter {
            auto operator==(Simple_parameter const&) const -> bool = default;
        };

        struct Splat {
            auto operator==(Splat const&) const -> bool = default;
        };

        struct Constant_read {
            utl::String_id name;
            auto operator==(Constant_read const&) const -> bool = default;
        };
    } // namespace kind

    struct Kind
        : std::variant<
              kind::Binary,
              kind::Assign,
              kind::Brace_block,
              kind::Local_variable_access,
              kind::Instance_variable_access,
              kind::Class_variable_access,
              kind::Global_variable_access,
              kind::Self_access,
              kind::Integer_literal,
              kind::Range_literal,
              kind::Method_call,
              kind::Stmt_sequence,
              kind::Simple_parameter,
              kind::Splat,
              kind::Constant_read> {
        using variant::variant;
        auto operator==(Kind const&) const -> bool = default;
    };

    // Synthesize a fresh node of `kind` in this child slot.
    struct Synth_child {
        Kind kind;
        auto operator==(Synth_child const&) const -> bool = default;
    };

    // This child slot is filled by an existing real node.
    struct Real_child_ref {
        ast::Node_id node;
        auto operator==(Real_child_ref const&) const -> bool = default;
    };

    // This child slot is filled by an existing synthetic node.
    struct Synth_child_ref {
        Synth_id node;
        auto operator==(Synth_child_ref const&) const -> bool = default;
    };

    struct Child : std::variant<Synth_child, Real_child_ref, Synth_child_ref> {
        using variant::variant;
        auto operator==(Child const&) const -> bool = default;
    };

    // A child slot of a node.
    struct Slot {
        Node         node;
        std::int32_t index {};
        auto operator==(Slot const&) const -> bool = default;
    };

    // The address of a synthetic node.
    struct Synth_key {
        Node         parent;
        std::int32_t index {};
        Kind         kind;
        auto operator==(Synth_key const&) const -> bool = default;
    };

    struct Hash_node {
        auto operator()(Node const& node) const noexcept -> std::size_t;
    };

    struct Hash_kind {
        auto operator()(Kind const& kind) const noexcept -> std::size_t;
    };

    struct Hash_slot {
        auto operator()(Slot const& slot) const noexcept -> std::size_t;
    };

    struct Hash_synth_key {
        auto operator()(Synth_key const& key) const noexcept -> std::size_t;
    };

    struct Method_signature {
        utl::String_id name;
        bool           setter {};
        std::uint32_t  arity {};
        auto operator==(Method_signature const&) const -> bool = default;
    };

    struct Hash_method_signature {
        auto operator()(Method_signature const& signature) const noexcept -> std::size_t;
    };

    // Kinds and literal values a rule needs, collected before any query.
    struct Demands {
        std::vector<Method_signature> method_calls;
        std::vector<utl::String_id>   constants;
        std::vector<std::int64_t>     integers;
    };

    // Interned method call signatures and constant names.
    // Populated once when a context is created, read-only afterwards.
    class Kind_registry {
        using Signature_map
            = std::unordered_map<Method_signature, Method_call_kind_id, Hash_method_signature>;

        utl::Index_vector<Method_call_kind_id, Method_signature>   m_method_calls;
        Signature_map                                              m_method_call_ids;
        std::unordered_set<utl::String_id, utl::Hash_vector_index> m_constants;
    public:
        auto add_method_call(Method_signature signature) -> Method_call_kind_id;

        void add_constant(utl::String_id name);

        [[nodiscard]] auto find_method_call(Method_signature signature) const
            -> std::optional<Method_call_kind_id>;

        [[nodiscard]] auto method_call(Method_call_kind_id id) const -> Method_signature const&;

        [[nodiscard]] auto has_constant(utl::String_id name) const -> bool;

        [[nodiscard]] auto method_call_count() const noexcept -> std::size_t;

        [[nodiscard]] auto constant_count() const noexcept -> std::size_t;
    };

    // Whether `value` can be the value of a synthetic integer literal.
    [[nodiscard]] auto is_synthesizable_integer(std::int64_t value) noexcept -> bool;

    // Describe `kind`, for example "method call []= (setter, arity 2)".
    [[nodiscard]] auto describe_kind(
        Kind const& kind, Kind_registry const& registry, db::Database const& db) -> std::string;

    // Turn a node into a reference to it, picking the real or synthetic tier.
    [[nodiscard]] auto child_ref(Node node) -> Child;

    // The real node, if `node` is real.
    [[nodiscard]] auto as_real(Node node) -> std::optional<ast::Node_id>;

    // The synthetic node, if `node` is synthetic.
    [[nodiscard]] auto as_synth(Node node) -> std::optional<Synth_id>;

} // namespace du::syn

#endif // DULCE_LIBSYNTH_KIND
