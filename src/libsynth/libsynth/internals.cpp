#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

auto du::syn::rule_child(Context& ctx, Rule const& rule, Node parent, std::int32_t index)
    -> std::optional<Child>
{
    return std::visit(
        [&]<typename R>(R const& alternative) -> std::optional<Child> {
            if constexpr (provides_child<R>) {
                return alternative.child(ctx, parent, index);
            }
            else {
                return std::nullopt;
            }
        },
        rule);
}

auto du::syn::rule_location(Context& ctx, Rule const& rule, Synth_id node)
    -> std::optional<lsp::Range>
{
    return std::visit(
        [&]<typename R>(R const& alternative) -> std::optional<lsp::Range> {
            if constexpr (provides_location<R>) {
                return alternative.location(ctx, node);
            }
            else {
                return std::nullopt;
            }
        },
        rule);
}

auto du::syn::rule_declares_variable(Context& ctx, Rule const& rule, Node node, std::int32_t slot)
    -> bool
{
    return std::visit(
        [&]<typename R>(R const& alternative) {
            if constexpr (provides_variables<R>) {
                return alternative.declares_variable(ctx, node, slot);
            }
            else {
                return false;
            }
        },
        rule);
}

auto du::syn::rule_variable_slot_limit(Context& ctx, Rule const& rule, Node node) -> std::int32_t
{
    return std::visit(
        [&]<typename R>(R const& alternative) -> std::int32_t {
            if constexpr (provides_variables<R>) {
                return alternative.variable_slot_limit(ctx, node);
            }
            else {
                return 0;
            }
        },
        rule);
}

auto du::syn::rule_excludes(Context& ctx, Rule const& rule, ast::Node_id node) -> bool
{
    return std::visit(
        [&]<typename R>(R const& alternative) {
            if constexpr (provides_exclusions<R>) {
                return alternative.excludes(ctx, node);
            }
            else {
                return false;
            }
        },
        rule);
}

void du::syn::rule_node_demands(Context& ctx, Rule const& rule, ast::Node_id node, Demands& demands)
{
    std::visit(
        [&]<typename R>(R const& alternative) {
            if constexpr (provides_node_demands<R>) {
                alternative.demands(ctx, node, demands);
            }
        },
        rule);
}

void du::syn::rule_global_demands(Context& ctx, Rule const& rule, Demands& demands)
{
    std::visit(
        [&]<typename R>(R const& alternative) {
            if constexpr (provides_global_demands<R>) {
                alternative.demands(ctx, demands);
            }
        },
        rule);
}

auto du::syn::resolve(Context& ctx, Slot const slot, Child const& child) -> Node
{
    auto const visitor = utl::Overload {
        [&](Synth_child const& synth) -> Node {
            return ctx.synth.intern(
                Synth_key { .parent = slot.node, .index = slot.index, .kind = synth.kind });
        },
        [&](Real_child_ref const& ref) -> Node {
            cpputil::always_assert(ctx.db.ast.nodes.contains(ref.node));
            return ref.node;
        },
        [&](Synth_child_ref const& ref) -> Node {
            cpputil::always_assert(ctx.synth.contains(ref.node));
            return ref.node;
        },
    };
    return std::visit(visitor, child);
}

auto du::syn::address(Context& ctx, Node const node) -> std::optional<Synth_key>
{
    return as_synth(node).transform([&](Synth_id const id) { return ctx.synth.key(id); });
}

auto du::syn::is_assignment(Context& ctx, Node const node) -> bool
{
    if (real_as<ast::node::Assignment>(ctx, node) != nullptr) {
        return true;
    }
    return address(ctx, node)
        .transform([](Synth_key const& key) { return std::holds_alternative<kind::Assign>(key.kind); })
        .value_or(false);
}

auto du::syn::real_child(Context& ctx, Node const parent, std::int32_t const index)
    -> std::optional<ast::Node_id>
{
    return child_fact(ctx, parent, index).and_then([](Child const& child) {
        if (auto const* const ref = std::get_if<Real_child_ref>(&child)) {
            return std::optional(ref->node);
        }
        return std::optional<ast::Node_id>();
    });
}

auto du::syn::required_child(Context& ctx, Node const parent, std::int32_t const index) -> Node
{
    auto node = child(ctx, parent, index);
    cpputil::always_assert(node.has_value());
    return node.value();
}

auto du::syn::real_range(Context const& ctx, ast::Node_id const node) -> lsp::Range
{
    return ctx.db.ast.nodes[node].range;
}

auto du::syn::local(Node const introducer, std::int32_t const slot) -> Child
{
    return Synth_child {
        kind::Local_variable_access {
            Synth_variable { .introducer = introducer, .slot = slot },
        },
    };
}

auto du::syn::synth(Kind kind) -> Child
{
    return Synth_child { .kind = std::move(kind) };
}

auto du::syn::method_call_kind(Context& ctx, Method_signature const signature) -> Kind
{
    auto const id = ctx.registry.find_method_call(signature);
    cpputil::always_assert(id.has_value());
    return kind::Method_call { .id = id.value() };
}

auto du::syn::integer_kind(std::int64_t const value) -> std::optional<Kind>
{
    if (is_synthesizable_integer(value)) {
        return kind::Integer_literal { .value = value };
    }
    return std::nullopt;
}

auto du::syn::setter_name(Context& ctx, utl::String_id const name) -> utl::String_id
{
    return ctx.db.string_pool.make(std::format("{}=", ctx.db.string_pool.get(name)));
}

auto du::syn::to_index(std::size_t const value) -> std::int32_t
{
    return cpputil::num::safe_cast<std::int32_t>(value);
}

auto du::syn::to_size(std::int32_t const value) -> std::size_t
{
    return cpputil::num::safe_cast<std::size_t>(value);
}
