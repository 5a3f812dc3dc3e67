#include <libutl/utilities.hpp>
#include <libsynth/synth.hpp>
#include <libsynth/internals.hpp>

using namespace du;
using namespace du::syn;

namespace {
    void report_integer_demands(
        db::Database& db, std::span<std::int64_t const> integers, lsp::Range const range)
    {
        for (std::int64_t const value : integers) {
            if (not is_synthesizable_integer(value)) {
                db::add_error(
                    db,
                    range,
                    std::format(
                        "Synthetic integer literal {} is outside of the supported range [{}, {}]",
                        value,
                        integer_literal_min,
                        integer_literal_max));
            }
        }
    }

    void register_demands(Kind_registry& registry, Demands const& demands)
    {
        for (Method_signature const& signature : demands.method_calls) {
            (void)registry.add_method_call(signature);
        }
        for (utl::String_id const constant : demands.constants) {
            registry.add_constant(constant);
        }
    }

    auto compute_child(Context& ctx, Node const parent, std::int32_t const index)
        -> std::optional<Child>
    {
        if (auto const real = as_real(parent)) {
            if (auto const id = ast::child(ctx.db.ast, real.value(), index)) {
                return Real_child_ref { .node = id.value() };
            }
        }
        std::optional<Child>       result;
        std::optional<std::size_t> source;
        for (std::size_t i = 0; i != ctx.rules.size(); ++i) {
            std::optional<Child> fact = rule_child(ctx, ctx.rules[i], parent, index);
            if (not fact.has_value()) {
                continue;
            }
            if (not result.has_value()) {
                result = std::move(fact);
                source = i;
            }
            else if (fact != result and db::is_debug(ctx.db)) {
                std::println(
                    std::cerr,
                    "[debug] Conflicting children at index {} of {}: keeping the {} fact, "
                    "ignoring the {} fact",
                    index,
                    describe(ctx, parent),
                    rule_name(ctx.rules[source.value()]),
                    rule_name(ctx.rules[i]));
            }
        }
        return result;
    }

    auto compute_location(Context& ctx, Node const node) -> lsp::Range
    {
        Node current = node;
        for (;;) {
            if (auto const real = as_real(current)) {
                return real_range(ctx, real.value());
            }
            Synth_id const id = as_synth(current).value();
            for (Rule const& rule : ctx.rules) {
                if (auto const range = rule_location(ctx, rule, id)) {
                    return range.value();
                }
            }
            current = ctx.synth.key(id).parent;
        }
    }

    void visit_in_evaluation_order(Context& ctx, Node const node, std::vector<Node>& order)
    {
        if (is_excluded_from_control_flow(ctx, node)) {
            return;
        }
        if (auto const replacement = desugared(ctx, node)) {
            visit_in_evaluation_order(ctx, replacement.value(), order);
            return;
        }
        order.push_back(node);
        for (Node const child : children(ctx, node)) {
            visit_in_evaluation_order(ctx, child, order);
        }
    }

    // The deepest desugar level at which `target` occurs in the tree rooted at `node`.
    auto deepest_occurrence(Context& ctx, Node const node, std::size_t const level, Node const target)
        -> std::optional<std::size_t>
    {
        if (node == target) {
            return level;
        }
        std::optional<std::size_t> deepest;
        auto const                 consider = [&](std::optional<std::size_t> const found) {
            if (found.has_value() and found.value() > deepest.value_or(0)) {
                deepest = found;
            }
        };
        for (Node const child : children(ctx, node)) {
            consider(deepest_occurrence(ctx, child, level, target));
        }
        if (auto const form = desugared(ctx, node)) {
            consider(deepest_occurrence(ctx, form.value(), level + 1, target));
        }
        return deepest;
    }

    // Real nodes are reused by the desugared forms of their real ancestors only.
    auto real_desugar_level(Context& ctx, ast::Node_id const node) -> std::size_t
    {
        std::size_t level = 0;
        for (auto ancestor = ast::parent(ctx.db.ast, node); ancestor.has_value();
             ancestor      = ast::parent(ctx.db.ast, ancestor.value())) {
            if (auto const form = desugared(ctx, ancestor.value())) {
                level = std::max(
                    level, deepest_occurrence(ctx, form.value(), 1, node).value_or(0));
            }
        }
        return level;
    }
} // namespace

auto du::syn::Synth_arena::intern(Synth_key const& key) -> Synth_id
{
    return m_ids.find_or_insert(key, [&] {
        std::scoped_lock _(m_mutex);
        m_keys.push_back(key);
        return Synth_id(m_keys.size() - 1);
    });
}

auto du::syn::Synth_arena::key(Synth_id const id) const -> Synth_key const&
{
    std::scoped_lock _(m_mutex);
    return m_keys.at(id.get());
}

auto du::syn::Synth_arena::contains(Synth_id const id) const -> bool
{
    std::scoped_lock _(m_mutex);
    return id.get() < m_keys.size();
}

auto du::syn::Synth_arena::size() const -> std::size_t
{
    std::scoped_lock _(m_mutex);
    return m_keys.size();
}

du::syn::Context::Context(db::Database& db, std::vector<Rule> rules)
    : db(db), rules(std::move(rules))
{
    for (Rule const& rule : this->rules) {
        Demands demands;
        rule_global_demands(*this, rule, demands);
        register_demands(registry, demands);
        report_integer_demands(db, demands.integers, lsp::to_range_0(lsp::Position {}));
    }
    for (ast::Node_id const id : db.ast.nodes.indices()) {
        Demands demands;
        for (Rule const& rule : this->rules) {
            rule_node_demands(*this, rule, id, demands);
        }
        register_demands(registry, demands);
        report_integer_demands(db, demands.integers, real_range(*this, id));
    }
    if (db::is_debug(db)) {
        std::println(
            std::cerr,
            "[debug] Synthesis context: {} rules, {} real nodes, {} method call kinds, {} constants",
            this->rules.size(),
            db.ast.nodes.size(),
            registry.method_call_count(),
            registry.constant_count());
    }
}

auto du::syn::child_fact(Context& ctx, Node const parent, std::int32_t const index)
    -> std::optional<Child>
{
    if (not ctx.db.config.memoize) {
        return compute_child(ctx, parent, index);
    }
    Slot const slot { .node = parent, .index = index };
    if (auto cached = ctx.child_cache.find(slot)) {
        return std::move(cached).value();
    }
    // Computed without holding the lock. A racing writer may win, both results are equal.
    return ctx.child_cache.insert(slot, compute_child(ctx, parent, index));
}

auto du::syn::child(Context& ctx, Node const parent, std::int32_t const index)
    -> std::optional<Node>
{
    return child_fact(ctx, parent, index).transform([&](Child const& fact) {
        return resolve(ctx, Slot { .node = parent, .index = index }, fact);
    });
}

auto du::syn::children(Context& ctx, Node const node) -> std::vector<Node>
{
    std::size_t const slot_count = as_real(node)
                                       .transform([&](ast::Node_id const id) {
                                           return ast::child_slots(ctx.db.ast, id).size();
                                       })
                                       .value_or(0);
    std::vector<Node> result;
    for (std::int32_t index = 0;; ++index) {
        if (auto const node_child = child(ctx, node, index)) {
            result.push_back(node_child.value());
        }
        else if (to_size(index) >= slot_count) {
            break;
        }
    }
    return result;
}

auto du::syn::desugared(Context& ctx, Node const node) -> std::optional<Node>
{
    return child(ctx, node, -1);
}

auto du::syn::location(Context& ctx, Node const node) -> lsp::Range
{
    if (auto const real = as_real(node)) {
        return real_range(ctx, real.value());
    }
    if (not ctx.db.config.memoize) {
        return compute_location(ctx, node);
    }
    if (auto const cached = ctx.location_cache.find(node)) {
        return cached.value();
    }
    return ctx.location_cache.insert(node, compute_location(ctx, node));
}

auto du::syn::is_excluded_from_control_flow(Context& ctx, Node const node) -> bool
{
    auto const real = as_real(node);
    return real.has_value() and std::ranges::any_of(ctx.rules, [&](Rule const& rule) {
               return rule_excludes(ctx, rule, real.value());
           });
}

auto du::syn::declared_variables(Context& ctx, Node const node) -> std::vector<Synth_variable>
{
    auto const declares = [&](std::int32_t const slot) {
        return std::ranges::any_of(ctx.rules, [&](Rule const& rule) {
            return rule_declares_variable(ctx, rule, node, slot);
        });
    };
    std::vector<Synth_variable> variables;
    for (std::int32_t slot = 0; declares(slot); ++slot) {
        variables.push_back(Synth_variable { .introducer = node, .slot = slot });
    }
    return variables;
}

auto du::syn::variable_scope(Context& ctx, Synth_variable const variable) -> Scope
{
    return enclosing_scope(ctx, variable.introducer);
}

auto du::syn::enclosing_scope(Context& ctx, Node const node) -> Scope
{
    Node current = node;
    for (;;) {
        if (auto const real = as_real(current)) {
            return ast::enclosing_scope(ctx.db.ast, real.value());
        }
        Synth_key const key = ctx.synth.key(as_synth(current).value());
        if (auto const real_parent = as_real(key.parent)) {
            if (key.index >= 0) {
                if (auto const scope = ast::introduced_scope(ctx.db.ast, real_parent.value())) {
                    return scope.value();
                }
            }
            return ast::enclosing_scope(ctx.db.ast, real_parent.value());
        }
        Synth_id const synth_parent = as_synth(key.parent).value();
        if (std::holds_alternative<kind::Brace_block>(ctx.synth.key(synth_parent).kind)) {
            return synth_parent;
        }
        current = key.parent;
    }
}

auto du::syn::self_scope(Context& ctx, Node const node) -> ast::Scope_id
{
    Scope scope = enclosing_scope(ctx, node);
    while (auto const* const block = std::get_if<Synth_id>(&scope)) {
        scope = enclosing_scope(ctx, *block);
    }
    return ast::self_scope(ctx.db.ast, std::get<ast::Scope_id>(scope));
}

auto du::syn::parent(Context& ctx, Node const node) -> std::optional<Node>
{
    auto const visitor = utl::Overload {
        [&](ast::Node_id const id) -> std::optional<Node> { return ast::parent(ctx.db.ast, id); },
        [&](Synth_id const id) -> std::optional<Node> { return ctx.synth.key(id).parent; },
    };
    return std::visit(visitor, node);
}

auto du::syn::kind_of(Context& ctx, Synth_id const node) -> Kind
{
    return ctx.synth.key(node).kind;
}

auto du::syn::is_desugared_root(Context& ctx, Node const node) -> bool
{
    return address(ctx, node).transform([](Synth_key const& key) { return key.index == -1; })
        .value_or(false);
}

auto du::syn::desugar_level(Context& ctx, Node const node) -> std::size_t
{
    std::size_t level   = 0;
    Node        current = node;
    while (auto const id = as_synth(current)) {
        Synth_key const& key = ctx.synth.key(id.value());
        if (key.index == -1) {
            ++level;
        }
        current = key.parent;
    }
    return level + real_desugar_level(ctx, as_real(current).value());
}

auto du::syn::requires_method_call(
    Context& ctx, std::string_view const name, bool const setter, std::uint32_t const arity) -> bool
{
    return ctx.db.string_pool.find(name)
        .and_then([&](utl::String_id const id) {
            return ctx.registry.find_method_call(
                Method_signature { .name = id, .setter = setter, .arity = arity });
        })
        .has_value();
}

auto du::syn::requires_constant(Context& ctx, std::string_view const name) -> bool
{
    return ctx.db.string_pool.find(name)
        .transform([&](utl::String_id const id) { return ctx.registry.has_constant(id); })
        .value_or(false);
}

auto du::syn::evaluation_order(Context& ctx, Node const root) -> std::vector<Node>
{
    std::vector<Node> order;
    visit_in_evaluation_order(ctx, root, order);
    return order;
}

auto du::syn::describe(Context& ctx, Node const node) -> std::string
{
    auto const visitor = utl::Overload {
        [&](ast::Node_id const id) { return ast::describe(ctx.db.ast, ctx.db.string_pool, id); },
        [&](Synth_id const id) {
            return std::format(
                "synthetic {}",
                describe_kind(ctx.synth.key(id).kind, ctx.registry, ctx.db));
        },
    };
    return std::visit(visitor, node);
}
