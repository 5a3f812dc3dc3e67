#include <libutl/utilities.hpp>
#include <libsynth/synth.hpp>
#include <libsynth/internals.hpp>
#include <unordered_set>

using namespace du;
using namespace du::syn;

namespace {
    struct Fact {
        std::string_view source;
        Child            child;
    };

    struct Validation_state {
        Context&                            ctx;
        std::unordered_set<Node, Hash_node> visited;
        std::vector<Node>                   pending;
        std::size_t                         defect_count {};
    };

    void report(Validation_state& state, lsp::Range const range, std::string message)
    {
        db::add_error(state.ctx.db, range, std::move(message));
        ++state.defect_count;
    }

    auto zero_range() -> lsp::Range
    {
        return lsp::to_range_0(lsp::Position {});
    }

    // Every child fact for `slot`, tagged with its source, in priority order.
    auto child_facts(Context& ctx, Slot const slot) -> std::vector<Fact>
    {
        std::vector<Fact> facts;
        if (auto const real = as_real(slot.node)) {
            if (auto const id = ast::child(ctx.db.ast, real.value(), slot.index)) {
                facts.push_back(Fact {
                    .source = "syntax",
                    .child  = Real_child_ref { .node = id.value() },
                });
            }
        }
        for (Rule const& rule : ctx.rules) {
            if (auto const* const table = std::get_if<rule::Fact_table>(&rule)) {
                table->children.for_each_value(slot, [&](Child const& child) {
                    facts.push_back(Fact { .source = rule_name(rule), .child = child });
                });
            }
            else if (auto fact = rule_child(ctx, rule, slot.node, slot.index)) {
                facts.push_back(Fact { .source = rule_name(rule), .child = std::move(fact).value() });
            }
        }
        return facts;
    }

    // Every location fact for `node`, tagged with its source.
    auto location_facts(Context& ctx, Synth_id const node)
        -> std::vector<std::pair<std::string_view, lsp::Range>>
    {
        std::vector<std::pair<std::string_view, lsp::Range>> facts;
        for (Rule const& rule : ctx.rules) {
            if (auto const* const table = std::get_if<rule::Fact_table>(&rule)) {
                table->locations.for_each_value(ctx.synth.key(node), [&](lsp::Range const range) {
                    facts.emplace_back(rule_name(rule), range);
                });
            }
            else if (auto const range = rule_location(ctx, rule, node)) {
                facts.emplace_back(rule_name(rule), range.value());
            }
        }
        return facts;
    }

    // The location of `node`, if the inheritance chain reaches a real node within the bound.
    auto bounded_location(Context& ctx, Node const node) -> std::optional<lsp::Range>
    {
        std::size_t const bound   = ctx.synth.size() + ctx.db.ast.nodes.size() + 1;
        Node              current = node;
        for (std::size_t step = 0; step <= bound; ++step) {
            if (auto const real = as_real(current)) {
                if (not ctx.db.ast.nodes.contains(real.value())) {
                    return std::nullopt;
                }
                return real_range(ctx, real.value());
            }
            Synth_id const id = as_synth(current).value();
            if (not ctx.synth.contains(id)) {
                return std::nullopt;
            }
            for (Rule const& rule : ctx.rules) {
                if (auto const range = rule_location(ctx, rule, id)) {
                    return range.value();
                }
            }
            current = ctx.synth.key(id).parent;
        }
        return std::nullopt;
    }

    auto describe_child(Context& ctx, Child const& child) -> std::string
    {
        auto const visitor = utl::Overload {
            [&](Synth_child const& synth) {
                return std::format(
                    "new {}", describe_kind(synth.kind, ctx.registry, ctx.db));
            },
            [&](Real_child_ref const& ref) {
                if (not ctx.db.ast.nodes.contains(ref.node)) {
                    return std::format("real node #{}", ref.node.get());
                }
                return describe(ctx, ref.node);
            },
            [&](Synth_child_ref const& ref) {
                if (not ctx.synth.contains(ref.node)) {
                    return std::format("synthetic node #{}", ref.node.get());
                }
                return describe(ctx, ref.node);
            },
        };
        return std::visit(visitor, child);
    }

    auto is_dangling(Context& ctx, Child const& child) -> bool
    {
        if (auto const* const ref = std::get_if<Real_child_ref>(&child)) {
            return not ctx.db.ast.nodes.contains(ref->node);
        }
        if (auto const* const ref = std::get_if<Synth_child_ref>(&child)) {
            return not ctx.synth.contains(ref->node);
        }
        return false;
    }

    void validate_children(Validation_state& state, Node const node, lsp::Range const range)
    {
        Context& ctx = state.ctx;

        std::size_t const slot_count = as_real(node)
                                           .transform([&](ast::Node_id const id) {
                                               return ast::child_slots(ctx.db.ast, id).size();
                                           })
                                           .value_or(0);

        for (std::int32_t index = -1;; ++index) {
            Slot const        slot { .node = node, .index = index };
            std::vector<Fact> facts = child_facts(ctx, slot);
            if (facts.empty()) {
                if (index >= 0 and to_size(index) >= slot_count) {
                    break;
                }
                continue;
            }

            Fact const& chosen = facts.front();
            for (Fact const& other : facts | std::views::drop(1)) {
                if (other.child != chosen.child) {
                    report(
                        state,
                        range,
                        std::format(
                            "Conflicting children at index {} of {}: {} from {}, {} from {}",
                            index,
                            describe(ctx, node),
                            describe_child(ctx, chosen.child),
                            chosen.source,
                            describe_child(ctx, other.child),
                            other.source));
                }
            }

            if (is_dangling(ctx, chosen.child)) {
                report(
                    state,
                    range,
                    std::format(
                        "Dangling reference at index {} of {}: {} does not exist",
                        index,
                        describe(ctx, node),
                        describe_child(ctx, chosen.child)));
                continue;
            }

            Node const resolved = resolve(ctx, slot, chosen.child);
            if (state.visited.insert(resolved).second) {
                state.pending.push_back(resolved);
            }
        }
    }

    void validate_variables(Validation_state& state, Node const node, lsp::Range const range)
    {
        Context& ctx = state.ctx;

        std::vector<Synth_variable> const variables = declared_variables(ctx, node);
        std::int32_t const                count     = to_index(variables.size());

        std::int32_t limit = 0;
        for (Rule const& rule : ctx.rules) {
            limit = std::max(limit, rule_variable_slot_limit(ctx, rule, node));
        }

        for (std::int32_t slot = count + 1; slot < limit; ++slot) {
            bool const declared = std::ranges::any_of(ctx.rules, [&](Rule const& rule) {
                return rule_declares_variable(ctx, rule, node, slot);
            });
            if (declared) {
                report(
                    state,
                    range,
                    std::format(
                        "Variable slot {} of {} is declared, but slot {} is not",
                        slot,
                        describe(ctx, node),
                        count));
            }
        }

        if (variables.empty()) {
            return;
        }
        auto const visitor = utl::Overload {
            [&](ast::Scope_id const scope) { return ctx.db.ast.scopes.contains(scope); },
            [&](Synth_id const block) { return ctx.synth.contains(block); },
        };
        if (not std::visit(visitor, variable_scope(ctx, variables.front()))) {
            report(
                state,
                range,
                std::format(
                    "{} introduces {} variables, but has no enclosing scope",
                    describe(ctx, node),
                    variables.size()));
        }
    }

    void validate_node(Validation_state& state, Node const node)
    {
        Context& ctx = state.ctx;

        std::optional<lsp::Range> const range = bounded_location(ctx, node);
        if (not range.has_value()) {
            report(
                state,
                zero_range(),
                std::format(
                    "The location of {} does not resolve to a real node", describe(ctx, node)));
        }

        if (auto const id = as_synth(node)) {
            auto const facts = location_facts(ctx, id.value());
            for (auto const& [source, other] : facts | std::views::drop(1)) {
                if (other != facts.front().second) {
                    report(
                        state,
                        range.value_or(zero_range()),
                        std::format(
                            "Conflicting locations of {}: {} from {}, {} from {}",
                            describe(ctx, node),
                            facts.front().second,
                            facts.front().first,
                            other,
                            source));
                }
            }
        }

        validate_children(state, node, range.value_or(zero_range()));
        validate_variables(state, node, range.value_or(zero_range()));
    }
} // namespace

auto du::syn::validate(Context& ctx, std::span<Node const> const roots) -> std::size_t
{
    Validation_state state { .ctx = ctx, .visited = {}, .pending = {}, .defect_count = 0 };
    for (Node const root : roots) {
        if (state.visited.insert(root).second) {
            state.pending.push_back(root);
        }
    }
    while (not state.pending.empty()) {
        Node const node = state.pending.back();
        state.pending.pop_back();
        validate_node(state, node);
    }
    if (db::is_debug(ctx.db)) {
        std::println(
            std::cerr,
            "[debug] Validated {} nodes, found {} defects",
            state.visited.size(),
            state.defect_count);
    }
    return state.defect_count;
}
