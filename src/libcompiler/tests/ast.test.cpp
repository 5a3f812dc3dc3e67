#include <libutl/utilities.hpp>
#include <libcompiler/db.hpp>
#include <catch2/catch_test_macros.hpp>
#include <sstream>

#define TEST(name) TEST_CASE("libcompiler " name, "[libcompiler]") // NOLINT

using namespace du;

namespace {
    auto range(std::uint32_t const column, std::uint32_t const width) -> lsp::Range
    {
        return lsp::Range(
            lsp::Position { .line = 0, .column = column },
            lsp::Position { .line = 0, .column = column + width });
    }

    auto call(ast::Builder& builder, std::optional<ast::Node_id> receiver, std::string_view name)
        -> ast::node::Method_call
    {
        return ast::node::Method_call {
            .receiver        = receiver,
            .name            = builder.name(name, range(0, 1)),
            .arguments       = {},
            .block           = std::nullopt,
            .scope_qualified = false,
        };
    }
} // namespace

TEST("method call child slots")
{
    auto         db = db::database({});
    ast::Builder builder(db);

    auto const recv  = builder.variable("r", ast::Variable_kind::Local, range(0, 1));
    auto const arg   = builder.integer(1, range(4, 1));
    auto       mc    = call(builder, recv, "[]");
    mc.arguments     = { arg };
    auto const mc_id = builder.method_call(std::move(mc), range(0, 5));

    REQUIRE(ast::child(db.ast, mc_id, 0) == recv);
    REQUIRE(ast::child(db.ast, mc_id, 1) == arg);
    REQUIRE(ast::child(db.ast, mc_id, 2) == std::nullopt);
    REQUIRE(ast::child(db.ast, mc_id, -1) == std::nullopt);
    REQUIRE(ast::parent(db.ast, arg) == mc_id);
    REQUIRE(ast::index_in_parent(db.ast, arg) == 1);
    REQUIRE(ast::child_slots(db.ast, mc_id).size() == 2);
}

TEST("implicit receiver leaves the first slot empty")
{
    auto         db = db::database({});
    ast::Builder builder(db);

    auto const bare = builder.identifier_call(builder.name("foo", range(0, 3)), range(0, 3));
    auto const mc   = builder.method_call(call(builder, std::nullopt, "bar"), range(4, 5));

    REQUIRE(ast::child_slots(db.ast, bare) == std::vector<std::optional<ast::Node_id>> { std::nullopt });
    REQUIRE(ast::child_slots(db.ast, mc).size() == 1);
    REQUIRE_FALSE(ast::child(db.ast, mc, 0).has_value());
    REQUIRE(ast::has_receiver(std::get<ast::node::Method_call>(db.ast.nodes[mc].variant)));

    auto qualified            = call(builder, std::nullopt, "baz");
    qualified.scope_qualified = true;
    REQUIRE_FALSE(ast::has_receiver(qualified));
}

TEST("local variables are shared through blocks")
{
    auto         db = db::database({});
    ast::Builder builder(db);

    auto const outer = builder.variable("x", ast::Variable_kind::Local, range(0, 1));
    (void)builder.enter_scope(ast::Scope_kind::Block);
    auto const inner = builder.variable("x", ast::Variable_kind::Local, range(4, 1));
    auto const fresh = builder.variable("y", ast::Variable_kind::Local, range(6, 1));
    auto const block = builder.block({}, { inner, fresh }, range(2, 8));
    auto const top   = builder.toplevel({ outer, block }, range(0, 10));

    auto const variable_of = [&](ast::Node_id const id) {
        return std::get<ast::node::Variable_access>(db.ast.nodes[id].variant).variable;
    };
    REQUIRE(variable_of(outer) == variable_of(inner));
    REQUIRE(db.ast.variables[variable_of(fresh)].scope == ast::introduced_scope(db.ast, block));
    REQUIRE(ast::enclosing_scope(db.ast, block) == ast::introduced_scope(db.ast, top));
    REQUIRE(ast::self_scope(db.ast, ast::enclosing_scope(db.ast, inner))
            == ast::introduced_scope(db.ast, top));
}

TEST("methods do not see outer locals")
{
    auto         db = db::database({});
    ast::Builder builder(db);

    auto const outer = builder.variable("x", ast::Variable_kind::Local, range(0, 1));
    auto const scope = builder.enter_scope(ast::Scope_kind::Method);
    auto const inner = builder.variable("x", ast::Variable_kind::Local, range(8, 1));
    auto const ivar  = builder.variable("@x", ast::Variable_kind::Instance, range(10, 2));
    auto const m     = builder.method(builder.name("m", range(6, 1)), {}, { inner, ivar }, range(2, 12));
    (void)builder.toplevel({ outer, m }, range(0, 14));

    auto const variable_of = [&](ast::Node_id const id) {
        return std::get<ast::node::Variable_access>(db.ast.nodes[id].variant).variable;
    };
    REQUIRE(variable_of(outer) != variable_of(inner));
    REQUIRE(db.ast.variables[variable_of(inner)].scope == scope);
    REQUIRE(db.ast.variables[variable_of(ivar)].kind == ast::Variable_kind::Instance);
    REQUIRE(db.ast.scopes[scope].node == m);
    REQUIRE(ast::self_scope(db.ast, scope) == scope);
}

TEST("assignment targets")
{
    auto         db = db::database({});
    ast::Builder builder(db);

    auto const a      = builder.variable("a", ast::Variable_kind::Local, range(0, 1));
    auto const b      = builder.variable("b", ast::Variable_kind::Local, range(4, 1));
    auto const splat  = builder.splat(b, range(3, 2));
    auto const c      = builder.variable("c", ast::Variable_kind::Local, range(7, 1));
    auto const lhs    = builder.destructured_lhs({ a, splat, c }, range(0, 8));
    auto const w      = builder.variable("w", ast::Variable_kind::Local, range(11, 1));
    auto const assign = builder.assignment(lhs, w, range(0, 12));

    REQUIRE(ast::is_assignment_target(db.ast, lhs));
    REQUIRE(ast::is_assignment_target(db.ast, a));
    REQUIRE(ast::is_assignment_target(db.ast, b));
    REQUIRE_FALSE(ast::is_assignment_target(db.ast, w));
    REQUIRE_FALSE(ast::is_assignment_target(db.ast, assign));

    auto const& destructured = std::get<ast::node::Destructured_lhs>(db.ast.nodes[lhs].variant);
    REQUIRE(ast::rest_index(db.ast, destructured) == 1);
}

TEST("describe")
{
    auto         db = db::database({});
    ast::Builder builder(db);

    auto const ivar = builder.variable("@x", ast::Variable_kind::Instance, range(0, 2));
    auto const one  = builder.integer(1, range(6, 1));
    auto const op   = builder.assign_operation(
        ast::Binary_operator::Add, ivar, one, range(3, 2), range(0, 7));
    auto const text = builder.string("hi", range(0, 4));

    REQUIRE(ast::describe(db.ast, db.string_pool, ivar) == "instance variable @x");
    REQUIRE(ast::describe(db.ast, db.string_pool, one) == "integer 1");
    REQUIRE(ast::describe(db.ast, db.string_pool, op) == "operator assignment +=");
    REQUIRE(ast::describe(db.ast, db.string_pool, text) == "string \"hi\"");
}

TEST("diagnostics")
{
    auto db = db::database({});
    db::add_error(db, range(2, 3), "bad thing");
    db::add_diagnostic(
        db,
        lsp::Diagnostic {
            .message      = "odd thing",
            .range        = range(0, 1),
            .severity     = lsp::Severity::Information,
            .related_info = { lsp::Diagnostic_related { .message = "here", .range = range(4, 1) } },
        });

    REQUIRE(db.diagnostics.size() == 2);
    REQUIRE(db.diagnostics.front().severity == lsp::Severity::Error);

    std::ostringstream stream;
    db::print_diagnostics(stream, db);
    REQUIRE(
        stream.str()
        == "Error 1:3-1:6: bad thing\nInfo 1:1-1:2: odd thing\n    note 1:5-1:6: here\n");
}

TEST("zero width ranges")
{
    auto const position = lsp::Position { .line = 3, .column = 7 };
    auto const range    = lsp::to_range_0(position);
    REQUIRE(range.start == range.stop);
    REQUIRE(std::format("{}", range) == "4:8-4:8");
}
