#include <libutl/utilities.hpp>
#include <libsynth/synth.hpp>
#include <libsynth/display.hpp>
#include <catch2/catch_test_macros.hpp>
#include "synth_test.hpp"
#include <thread>

#define TEST(name) TEST_CASE("libsynth " name, "[libsynth]") // NOLINT

using namespace du;
using test::range;

namespace {
    // r.attr = 1; h[k] += 2; a, *b = w; [1, 2]; for x in xs; puts x; end
    auto build_everything(test::Program& p) -> ast::Node_id
    {
        auto const recv        = p.local("r", 0);
        auto const attribute   = p.call(recv, "attr", {}, range(0, 6));
        auto const one         = p.integer(1, 9);
        auto const setter      = p.builder.assignment(attribute, one, range(0, 10));

        auto const hash        = p.local("h", 12);
        auto const key         = p.local("k", 14);
        auto const index       = p.call(hash, "[]", { key }, range(12, 4));
        auto const two         = p.integer(2, 20);
        auto const operation   = p.builder.assign_operation(
            ast::Binary_operator::Add, index, two, range(17, 2), range(12, 9));

        auto const a           = p.local("a", 23);
        auto const b           = p.local("b", 27);
        auto const rest        = p.builder.splat(b, range(26, 2));
        auto const lhs         = p.builder.destructured_lhs({ a, rest }, range(23, 5));
        auto const value       = p.local("w", 31);
        auto const destructure = p.builder.assignment(lhs, value, range(23, 9));

        auto const first       = p.integer(1, 35);
        auto const second      = p.integer(2, 38);
        auto const array       = p.builder.array_literal({ first, second }, range(34, 6));

        auto const pattern     = p.local("x", 46);
        auto const iterable    = p.local("xs", 51);
        auto const argument    = p.local("x", 60);
        auto const puts        = p.call(std::nullopt, "puts", { argument }, range(55, 6));
        auto const body        = p.builder.sequence({ puts }, range(55, 6));
        auto const loop        = p.builder.for_loop(pattern, iterable, body, range(42, 24));

        return p.builder.toplevel({ setter, operation, destructure, array, loop }, range(0, 66));
    }

    auto contains(std::vector<syn::Node> const& nodes, syn::Node const node) -> bool
    {
        return std::ranges::contains(nodes, node);
    }
} // namespace

TEST("repeated queries return the same nodes")
{
    test::Program p;
    auto const    top = build_everything(p);

    syn::Context ctx(p.db);

    std::string const first = syn::display(ctx, top);
    std::size_t const size  = ctx.synth.size();

    REQUIRE(syn::display(ctx, top) == first);
    REQUIRE(ctx.synth.size() == size);

    for (syn::Node const node : test::reachable(ctx, top)) {
        REQUIRE(syn::desugared(ctx, node) == syn::desugared(ctx, node));
        REQUIRE(syn::children(ctx, node) == syn::children(ctx, node));
        REQUIRE(syn::location(ctx, node) == syn::location(ctx, node));
    }
    REQUIRE(ctx.synth.size() == size);
}

TEST("memoization does not change results")
{
    test::Program memoized;
    test::Program direct(db::Configuration { .log_level = db::Log_level::None, .memoize = false });

    auto const memoized_top = build_everything(memoized);
    auto const direct_top   = build_everything(direct);

    syn::Context memoized_ctx(memoized.db);
    syn::Context direct_ctx(direct.db);

    REQUIRE(syn::display(memoized_ctx, memoized_top) == syn::display(direct_ctx, direct_top));
    REQUIRE(syn::to_source(memoized_ctx, memoized_top) == syn::to_source(direct_ctx, direct_top));
    REQUIRE(memoized_ctx.synth.size() == direct_ctx.synth.size());

    auto const memoized_nodes = test::reachable(memoized_ctx, memoized_top);
    auto const direct_nodes   = test::reachable(direct_ctx, direct_top);
    REQUIRE(memoized_nodes.size() == direct_nodes.size());
    for (std::size_t i = 0; i != memoized_nodes.size(); ++i) {
        REQUIRE(
            syn::location(memoized_ctx, memoized_nodes[i])
            == syn::location(direct_ctx, direct_nodes[i]));
    }
}

TEST("concurrent queries agree")
{
    constexpr std::size_t thread_count = 8;

    test::Program reference;
    auto const    reference_top = build_everything(reference);
    syn::Context  reference_ctx(reference.db);
    std::string const expected = syn::display(reference_ctx, reference_top);

    test::Program p;
    auto const    top = build_everything(p);
    syn::Context  ctx(p.db);

    std::vector<std::string> results(thread_count);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i != thread_count; ++i) {
            threads.emplace_back([&, i] { results[i] = syn::display(ctx, top); });
        }
    }
    for (std::string const& result : results) {
        REQUIRE(result == expected);
    }
    REQUIRE(ctx.synth.size() == reference_ctx.synth.size());
}

TEST("every location resolves to a real node")
{
    test::Program p;
    auto const    top = build_everything(p);

    syn::Context ctx(p.db);

    std::size_t const depth = test::tree_depth(ctx, top);

    for (syn::Node const node : test::reachable(ctx, top)) {
        std::size_t              steps   = 0;
        std::optional<syn::Node> current = node;
        while (current.has_value() and syn::as_synth(current.value()).has_value()) {
            current = syn::parent(ctx, current.value());
            ++steps;
        }
        REQUIRE(current.has_value());
        REQUIRE(steps <= syn::desugar_level(ctx, node) + depth);
        REQUIRE(syn::desugar_level(ctx, node) <= depth);
        REQUIRE(syn::location(ctx, node).start.line == 0);
    }

    std::array const roots { syn::Node(top) };
    REQUIRE(syn::validate(ctx, roots) == 0);
    REQUIRE(p.db.diagnostics.empty());
}

TEST("evaluation order follows desugared forms and skips excluded nodes")
{
    test::Program p;
    auto const    top = build_everything(p);

    syn::Context ctx(p.db);

    auto const order = syn::evaluation_order(ctx, top);
    REQUIRE(order.front() == syn::Node(top));

    for (ast::Node_id const id : p.db.ast.nodes.indices()) {
        if (syn::is_excluded_from_control_flow(ctx, id) or syn::desugared(ctx, id).has_value()) {
            REQUIRE_FALSE(contains(order, id));
        }
    }
    for (syn::Node const node : order) {
        REQUIRE_FALSE(syn::is_excluded_from_control_flow(ctx, node));
        REQUIRE_FALSE(syn::desugared(ctx, node).has_value());
    }
    for (syn::Node const statement : syn::children(ctx, top)) {
        auto const form = syn::desugared(ctx, statement);
        REQUIRE(form.has_value());
        REQUIRE(contains(order, form.value()));
    }
}

TEST("evaluation order of a setter assignment")
{
    test::Program p;

    auto const recv   = p.local("r", 0);
    auto const target = p.call(recv, "attr", {}, range(0, 6));
    auto const value  = p.integer(1, 9);
    auto const assign = p.builder.assignment(target, value, range(0, 10));
    auto const top    = p.builder.toplevel({ assign }, range(0, 10));

    syn::Context ctx(p.db);

    auto const order = syn::evaluation_order(ctx, top);
    REQUIRE(order.size() == 8);
    REQUIRE(order[0] == syn::Node(top));
    REQUIRE(order[3] == syn::Node(recv));
    REQUIRE(order[6] == syn::Node(value));
    REQUIRE(
        test::kinds(ctx, { order[1], order[2], order[4], order[5], order[7] })
        == std::vector<syn::Kind> {
            syn::kind::Stmt_sequence {},
            test::method_call(ctx, "attr=", true, 1),
            syn::kind::Assign {},
            test::temporary(assign, 0),
            test::temporary(assign, 0),
        });
}

TEST("nothing is required unless demanded")
{
    test::Program p;

    auto const left   = p.local("x", 0);
    auto const assign = p.builder.assignment(left, p.integer(1, 4), range(0, 5));
    (void)p.builder.toplevel({ assign }, range(0, 5));

    syn::Context ctx(p.db);

    REQUIRE_FALSE(syn::requires_method_call(ctx, "each", false, 0));
    REQUIRE_FALSE(syn::requires_method_call(ctx, "never mentioned", false, 0));
    REQUIRE_FALSE(syn::requires_constant(ctx, "::Array"));
    REQUIRE(ctx.registry.method_call_count() == 0);
}

TEST("kind registry interns each signature once")
{
    utl::String_pool pool;
    syn::Kind_registry registry;

    auto const index  = pool.make("[]");
    auto const setter = pool.make("[]=");
    auto const array  = pool.make("::Array");

    auto const read  = registry.add_method_call({ .name = index, .setter = false, .arity = 1 });
    auto const write = registry.add_method_call({ .name = setter, .setter = true, .arity = 2 });
    REQUIRE(read != write);
    REQUIRE(registry.add_method_call({ .name = index, .setter = false, .arity = 1 }) == read);
    REQUIRE(registry.method_call_count() == 2);

    REQUIRE(registry.find_method_call({ .name = setter, .setter = true, .arity = 2 }) == write);
    REQUIRE_FALSE(registry.find_method_call({ .name = index, .setter = false, .arity = 2 }).has_value());
    REQUIRE_FALSE(registry.find_method_call({ .name = index, .setter = true, .arity = 1 }).has_value());
    REQUIRE(registry.method_call(write).arity == 2);

    registry.add_constant(array);
    registry.add_constant(array);
    REQUIRE(registry.has_constant(array));
    REQUIRE_FALSE(registry.has_constant(index));
    REQUIRE(registry.constant_count() == 1);
}

TEST("fact table supplies demands and exclusions")
{
    test::Program p;

    auto const left   = p.local("x", 0);
    auto const assign = p.builder.assignment(left, p.integer(1, 4), range(0, 5));
    (void)p.builder.toplevel({ assign }, range(0, 5));

    syn::rule::Fact_table table;
    table.exclusions.push_back(left);
    table.required.method_calls.push_back(syn::Method_signature {
        .name   = p.db.string_pool.make("frobnicate"),
        .setter = false,
        .arity  = 2,
    });
    table.required.constants.push_back(p.db.string_pool.make("::Hash"));

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    REQUIRE(syn::is_excluded_from_control_flow(ctx, left));
    REQUIRE_FALSE(syn::is_excluded_from_control_flow(ctx, assign));
    REQUIRE(syn::requires_method_call(ctx, "frobnicate", false, 2));
    REQUIRE(syn::requires_constant(ctx, "::Hash"));
    REQUIRE(p.db.diagnostics.empty());
}

TEST("out of range integer demands are reported")
{
    test::Program p;
    (void)p.builder.toplevel({}, range(0, 0));

    syn::rule::Fact_table table;
    table.required.integers = { 3, 5000 };

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    REQUIRE(p.db.diagnostics.size() == 1);
    REQUIRE(p.db.diagnostics.front().severity == lsp::Severity::Error);
    REQUIRE(
        p.db.diagnostics.front().message
        == "Synthetic integer literal 5000 is outside of the supported range [-1000, 1000]");
}

TEST("syntactic children win over conflicting facts")
{
    test::Program p;

    auto const left   = p.local("x", 0);
    auto const assign = p.builder.assignment(left, p.integer(1, 4), range(0, 5));
    (void)p.builder.toplevel({ assign }, range(0, 5));

    syn::rule::Fact_table table;
    table.children.add(
        syn::Slot { .node = assign, .index = 0 }, syn::Synth_child { .kind = test::integer(5) });

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    REQUIRE(syn::child(ctx, assign, 0) == syn::Node(left));

    std::array const roots { syn::Node(assign) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(p.db.diagnostics.size() == 1);
    REQUIRE(
        p.db.diagnostics.front().message
        == "Conflicting children at index 0 of assignment: "
           "local variable x from syntax, new integer 5 from fact table");
    REQUIRE(p.db.diagnostics.front().range == range(0, 5));
}

TEST("the first rule wins a conflict")
{
    test::Program p;

    auto const array = p.builder.array_literal({ p.integer(1, 1) }, range(0, 3));
    (void)p.builder.toplevel({ array }, range(0, 3));

    syn::rule::Fact_table table;
    table.children.add(
        syn::Slot { .node = array, .index = -1 }, syn::Synth_child { .kind = syn::kind::Stmt_sequence {} });

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    auto const form = syn::desugared(ctx, array);
    REQUIRE(form.has_value());
    REQUIRE(syn::kind_of(ctx, test::synth_id(form.value())) == test::method_call(ctx, "[]", false, 2));

    std::array const roots { syn::Node(array) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(
        p.db.diagnostics.front().message
        == "Conflicting children at index -1 of array literal: "
           "new method call [] (plain, arity 2) from array literal, "
           "new statement sequence from fact table");
}

TEST("repeated facts in one table")
{
    test::Program p;

    auto const left = p.local("x", 0);
    (void)p.builder.toplevel({ left }, range(0, 1));

    syn::Slot const slot { .node = left, .index = 0 };

    syn::rule::Fact_table table;
    table.children.add(slot, syn::Synth_child { .kind = test::integer(1) });
    table.children.add(slot, syn::Synth_child { .kind = test::integer(1) });
    table.children.add(slot, syn::Synth_child { .kind = test::integer(2) });

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    auto const fact = syn::child(ctx, left, 0);
    REQUIRE(fact.has_value());
    REQUIRE(syn::kind_of(ctx, test::synth_id(fact.value())) == test::integer(1));

    std::array const roots { syn::Node(left) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(
        p.db.diagnostics.front().message
        == "Conflicting children at index 0 of local variable x: "
           "new integer 1 from fact table, new integer 2 from fact table");
}

TEST("dangling references are reported")
{
    test::Program p;

    auto const left = p.local("x", 0);
    (void)p.builder.toplevel({ left }, range(0, 1));

    syn::rule::Fact_table table;
    table.children.add(
        syn::Slot { .node = left, .index = 0 }, syn::Real_child_ref { .node = ast::Node_id(999) });
    table.children.add(
        syn::Slot { .node = left, .index = 1 }, syn::Synth_child_ref { .node = syn::Synth_id(999) });

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    std::array const roots { syn::Node(left) };
    REQUIRE(syn::validate(ctx, roots) == 2);
    REQUIRE(p.db.diagnostics.size() == 2);
    REQUIRE(
        p.db.diagnostics[0].message
        == "Dangling reference at index 0 of local variable x: real node #999 does not exist");
    REQUIRE(
        p.db.diagnostics[1].message
        == "Dangling reference at index 1 of local variable x: synthetic node #999 does not exist");
}

TEST("conflicting locations are reported")
{
    test::Program p;

    auto const root = p.builder.current_scope();
    auto const foo  = p.builder.identifier_call(p.builder.name("foo", range(0, 3)), range(0, 3));
    (void)p.builder.toplevel({ foo }, range(0, 3));

    syn::rule::Fact_table table;
    table.locations.add(
        syn::Synth_key {
            .parent = foo,
            .index  = 0,
            .kind   = syn::kind::Self_access { .self_scope = root },
        },
        range(7, 2));

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    auto const self = syn::child(ctx, foo, 0).value();
    REQUIRE(syn::location(ctx, self) == lsp::to_range_0(range(0, 3).start));

    std::array const roots { syn::Node(foo) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(p.db.diagnostics.front().message.starts_with("Conflicting locations of synthetic self: "));
    REQUIRE(p.db.diagnostics.front().message.ends_with(" from fact table"));
}

TEST("variable slots must be dense")
{
    test::Program p;

    auto const left = p.local("x", 0);
    (void)p.builder.toplevel({ left }, range(0, 1));

    syn::rule::Fact_table table;
    table.variables.add(syn::Slot { .node = left, .index = 2 }, true);

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    REQUIRE(syn::declared_variables(ctx, left).empty());

    std::array const roots { syn::Node(left) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(
        p.db.diagnostics.front().message
        == "Variable slot 2 of local variable x is declared, but slot 0 is not");
}

TEST("distant variable slots are reported")
{
    test::Program p;

    auto const left = p.local("x", 0);
    (void)p.builder.toplevel({ left }, range(0, 1));

    syn::rule::Fact_table table;
    table.variables.add(syn::Slot { .node = left, .index = 0 }, true);
    table.variables.add(syn::Slot { .node = left, .index = 40 }, true);

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    REQUIRE(syn::declared_variables(ctx, left).size() == 1);

    std::array const roots { syn::Node(left) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(
        p.db.diagnostics.front().message
        == "Variable slot 40 of local variable x is declared, but slot 1 is not");
}

TEST("declared variables are dense and ordered")
{
    test::Program p;

    auto const call = p.call(p.local("r", 0), "[]", { p.local("i", 2) }, range(0, 4));
    auto const op   = p.builder.assign_operation(
        ast::Binary_operator::Add, call, p.integer(1, 9), range(5, 2), range(0, 10));
    (void)p.builder.toplevel({ op }, range(0, 10));

    syn::Context ctx(p.db);

    auto const variables = syn::declared_variables(ctx, op);
    REQUIRE(variables.size() == 3);
    for (std::size_t i = 0; i != variables.size(); ++i) {
        REQUIRE(variables[i].introducer == syn::Node(op));
        REQUIRE(variables[i].slot == static_cast<std::int32_t>(i));
        REQUIRE(syn::variable_scope(ctx, variables[i]) == syn::enclosing_scope(ctx, op));
    }
}

TEST("variables without an enclosing scope are reported")
{
    test::Program p;
    (void)p.builder.toplevel({}, range(0, 0));

    auto const orphan = p.db.ast.nodes.push(ast::Node {
        .variant = db::Integer { .value = 1 },
        .range   = range(0, 1),
        .scope   = ast::Scope_id(77),
        .parent  = std::nullopt,
    });

    syn::rule::Fact_table table;
    table.variables.add(syn::Slot { .node = orphan, .index = 0 }, true);

    auto rules = syn::default_rules();
    rules.push_back(std::move(table));
    syn::Context ctx(p.db, std::move(rules));

    std::array const roots { syn::Node(orphan) };
    REQUIRE(syn::validate(ctx, roots) == 1);
    REQUIRE(
        p.db.diagnostics.front().message
        == "integer 1 introduces 1 variables, but has no enclosing scope");
}
