#ifndef DULCE_LIBSYNTH_RULES
#define DULCE_LIBSYNTH_RULES

#include <libutl/utilities.hpp>
#include <libutl/flatmap.hpp>
#include <libsynth/kind.hpp>

/*

    A rule is a stateless producer of facts about nodes. Each rule may
    define any of the following member functions; a missing member
    contributes no facts.

        child(ctx, parent, index)         -> std::optional<Child>
        location(ctx, synth_id)           -> std::optional<lsp::Range>
        declares_variable(ctx, node, slot) -> bool
        variable_slot_limit(ctx, node)     -> std::int32_t
        excludes(ctx, real_node_id)       -> bool
        demands(ctx, real_node_id, out)   -> void
        demands(ctx, out)                 -> void

    A rule may only examine real nodes and the ancestors of the node it is
    asked about, which guarantees that every query terminates.

*/

namespace du::syn::rule {

    // `foo` and `foo(x)` receive `self` as their first child.
    struct Implicit_self {
        static constexpr std::string_view name = "implicit self";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
    };

    // `recv.attr = value` becomes `recv.attr=(tmp = value); tmp`.
    struct Setter_assignment {
        static constexpr std::string_view name = "setter assignment";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
        auto declares_variable(Context& ctx, Node node, std::int32_t slot) const -> bool;
        auto variable_slot_limit(Context& ctx, Node node) const -> std::int32_t;
        auto excludes(Context& ctx, ast::Node_id node) const -> bool;
        void demands(Context& ctx, ast::Node_id node, Demands& demands) const;
    };

    // `x += y` becomes `x = x + y`.
    struct Variable_assign_operation {
        static constexpr std::string_view name = "variable operator assignment";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
    };

    // `recv[i] += y` becomes
    // `t0 = recv; t1 = i; t2 = t0.[](t1) + y; t0.[]=(t1, t2); t2`.
    struct Setter_assign_operation {
        static constexpr std::string_view name = "setter operator assignment";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
        auto declares_variable(Context& ctx, Node node, std::int32_t slot) const -> bool;
        auto variable_slot_limit(Context& ctx, Node node) const -> std::int32_t;
        auto excludes(Context& ctx, ast::Node_id node) const -> bool;
        void demands(Context& ctx, ast::Node_id node, Demands& demands) const;
    };

    // `a, *b, c = w` becomes `tmp = *w; a = tmp[0]; b = tmp[1..-2]; c = tmp[-1]`.
    struct Destructured_assignment {
        static constexpr std::string_view name = "destructured assignment";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
        auto declares_variable(Context& ctx, Node node, std::int32_t slot) const -> bool;
        auto variable_slot_limit(Context& ctx, Node node) const -> std::int32_t;
        auto excludes(Context& ctx, ast::Node_id node) const -> bool;
        void demands(Context& ctx, ast::Node_id node, Demands& demands) const;
    };

    // `[a, b]` becomes `::Array.[](a, b)`.
    struct Array_literal {
        static constexpr std::string_view name = "array literal";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        void demands(Context& ctx, ast::Node_id node, Demands& demands) const;
    };

    // `for x in xs; body; end` becomes `xs.each { |tmp| x = tmp; body }`.
    struct For_loop {
        static constexpr std::string_view name = "for loop";

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
        auto declares_variable(Context& ctx, Node node, std::int32_t slot) const -> bool;
        auto variable_slot_limit(Context& ctx, Node node) const -> std::int32_t;
        auto excludes(Context& ctx, ast::Node_id node) const -> bool;
        void demands(Context& ctx, ast::Node_id node, Demands& demands) const;
    };

    // Explicit facts supplied at configuration time.
    struct Fact_table {
        static constexpr std::string_view name = "fact table";

        utl::Flatmap<Slot, Child>           children;
        utl::Flatmap<Synth_key, lsp::Range> locations;
        utl::Flatmap<Slot, bool>            variables;
        std::vector<ast::Node_id>           exclusions;
        Demands                             required;

        auto child(Context& ctx, Node parent, std::int32_t index) const -> std::optional<Child>;
        auto location(Context& ctx, Synth_id node) const -> std::optional<lsp::Range>;
        auto declares_variable(Context& ctx, Node node, std::int32_t slot) const -> bool;
        auto variable_slot_limit(Context& ctx, Node node) const -> std::int32_t;
        auto excludes(Context& ctx, ast::Node_id node) const -> bool;

        // Not tied to any particular node.
        void demands(Context& ctx, Demands& demands) const;
    };

} // namespace du::syn::rule

namespace du::syn {

    struct Rule
        : std::variant<
              rule::Implicit_self,
              rule::Setter_assignment,
              rule::Variable_assign_operation,
              rule::Setter_assign_operation,
              rule::Destructured_assignment,
              rule::Array_literal,
              rule::For_loop,
              rule::Fact_table> {
        using variant::variant;
    };

    // Every built-in rule, in priority order.
    [[nodiscard]] auto default_rules() -> std::vector<Rule>;

    [[nodiscard]] auto rule_name(Rule const& rule) -> std::string_view;

} // namespace du::syn

#endif // DULCE_LIBSYNTH_RULES
