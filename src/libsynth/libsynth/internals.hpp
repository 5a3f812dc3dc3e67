#ifndef DULCE_LIBSYNTH_INTERNALS
#define DULCE_LIBSYNTH_INTERNALS

#include <libutl/utilities.hpp>
#include <libsynth/synth.hpp>

namespace du::syn {

    template <typename R>
    concept provides_child = requires(R const& rule, Context& ctx, Node node, std::int32_t index) {
        { rule.child(ctx, node, index) } -> std::same_as<std::optional<Child>>;
    };

    template <typename R>
    concept provides_location = requires(R const& rule, Context& ctx, Synth_id node) {
        { rule.location(ctx, node) } -> std::same_as<std::optional<lsp::Range>>;
    };

    template <typename R>
    concept provides_variables = requires(R const& rule, Context& ctx, Node node, std::int32_t slot) {
        { rule.declares_variable(ctx, node, slot) } -> std::same_as<bool>;
        { rule.variable_slot_limit(ctx, node) } -> std::same_as<std::int32_t>;
    };

    template <typename R>
    concept provides_exclusions = requires(R const& rule, Context& ctx, ast::Node_id node) {
        { rule.excludes(ctx, node) } -> std::same_as<bool>;
    };

    template <typename R>
    concept provides_node_demands
        = requires(R const& rule, Context& ctx, ast::Node_id node, Demands& demands) {
              rule.demands(ctx, node, demands);
          };

    template <typename R>
    concept provides_global_demands = requires(R const& rule, Context& ctx, Demands& demands) {
        rule.demands(ctx, demands);
    };

    auto rule_child(Context& ctx, Rule const& rule, Node parent, std::int32_t index)
        -> std::optional<Child>;
    auto rule_location(Context& ctx, Rule const& rule, Synth_id node) -> std::optional<lsp::Range>;
    auto rule_declares_variable(Context& ctx, Rule const& rule, Node node, std::int32_t slot)
        -> bool;
    // Exclusive upper bound of the variable slots `rule` may declare at `node`.
    auto rule_variable_slot_limit(Context& ctx, Rule const& rule, Node node) -> std::int32_t;
    auto rule_excludes(Context& ctx, Rule const& rule, ast::Node_id node) -> bool;
    void rule_node_demands(Context& ctx, Rule const& rule, ast::Node_id node, Demands& demands);
    void rule_global_demands(Context& ctx, Rule const& rule, Demands& demands);

    // Turn a child fact into a node, interning synthetic nodes as needed.
    auto resolve(Context& ctx, Slot slot, Child const& child) -> Node;

    // The address of `node`, if it is synthetic.
    auto address(Context& ctx, Node node) -> std::optional<Synth_key>;

    // The address of `node`, if it is a synthetic node of kind `K` at `index` of its parent.
    template <typename K>
    auto address_of(Context& ctx, Node const node, std::int32_t const index)
        -> std::optional<Synth_key>
    {
        return address(ctx, node).and_then([&](Synth_key key) -> std::optional<Synth_key> {
            if (key.index == index and std::holds_alternative<K>(key.kind)) {
                return key;
            }
            return std::nullopt;
        });
    }

    // The real node variant alternative `T`, if `node` is a real `T`.
    template <typename T>
    auto real_as(Context const& ctx, Node const node) -> T const*
    {
        if (auto const id = as_real(node)) {
            return std::get_if<T>(&ctx.db.ast.nodes[id.value()].variant);
        }
        return nullptr;
    }

    // Whether `node` is a real assignment or a synthetic one.
    auto is_assignment(Context& ctx, Node node) -> bool;

    // The real node referenced by the fact for child `index` of `parent`, without interning.
    auto real_child(Context& ctx, Node parent, std::int32_t index) -> std::optional<ast::Node_id>;

    // Like `child`, but the child must exist.
    auto required_child(Context& ctx, Node parent, std::int32_t index) -> Node;

    auto real_range(Context const& ctx, ast::Node_id node) -> lsp::Range;

    // Access to the synthetic local variable introduced by `introducer` at `slot`.
    auto local(Node introducer, std::int32_t slot) -> Child;

    // Fresh node of `kind`.
    auto synth(Kind kind) -> Child;

    // The registered method call kind. Requesting an undemanded signature is a rule defect.
    auto method_call_kind(Context& ctx, Method_signature signature) -> Kind;

    // Integer literal kind, if `value` can be synthesized.
    auto integer_kind(std::int64_t value) -> std::optional<Kind>;

    // Intern `name` with a trailing `=`.
    auto setter_name(Context& ctx, utl::String_id name) -> utl::String_id;

    auto to_index(std::size_t value) -> std::int32_t;
    auto to_size(std::int32_t value) -> std::size_t;

} // namespace du::syn

#endif // DULCE_LIBSYNTH_INTERNALS
