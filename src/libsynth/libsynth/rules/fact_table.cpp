#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

auto du::syn::rule::Fact_table::child(Context&, Node const parent, std::int32_t const index) const
    -> std::optional<Child>
{
    if (Child const* const fact = children.find(Slot { .node = parent, .index = index })) {
        return *fact;
    }
    return std::nullopt;
}

auto du::syn::rule::Fact_table::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    if (lsp::Range const* const range = locations.find(ctx.synth.key(node))) {
        return *range;
    }
    return std::nullopt;
}

auto du::syn::rule::Fact_table::declares_variable(
    Context&, Node const node, std::int32_t const slot) const -> bool
{
    bool const* const declared = variables.find(Slot { .node = node, .index = slot });
    return declared != nullptr and *declared;
}

auto du::syn::rule::Fact_table::variable_slot_limit(Context&, Node const node) const
    -> std::int32_t
{
    std::int32_t limit = 0;
    for (auto const& [slot, declared] : variables) {
        if (declared and slot.node == node) {
            limit = std::max(limit, slot.index + 1);
        }
    }
    return limit;
}

auto du::syn::rule::Fact_table::excludes(Context&, ast::Node_id const node) const -> bool
{
    return std::ranges::contains(exclusions, node);
}

void du::syn::rule::Fact_table::demands(Context&, Demands& demands) const
{
    demands.method_calls.append_range(required.method_calls);
    demands.constants.append_range(required.constants);
    demands.integers.append_range(required.integers);
}
