#ifndef DULCE_LIBSYNTH_TESTS_SYNTH_TEST
#define DULCE_LIBSYNTH_TESTS_SYNTH_TEST

#include <libutl/utilities.hpp>
#include <libcompiler/db.hpp>
#include <libsynth/synth.hpp>
#include <libsynth/display.hpp>
#include <catch2/catch_test_macros.hpp>

namespace du::test {

    // A range on the first line.
    inline auto range(std::uint32_t const column, std::uint32_t const width) -> lsp::Range
    {
        return lsp::Range(
            lsp::Position { .line = 0, .column = column },
            lsp::Position { .line = 0, .column = column + width });
    }

    // A real AST under construction.
    struct Program {
        db::Database db;
        ast::Builder builder;

        explicit Program(db::Configuration const config = {})
            : db(db::database(config))
            , builder(db)
        {}

        Program(Program const&)                    = delete;
        auto operator=(Program const&) -> Program& = delete;

        auto local(std::string_view const name, std::uint32_t const column) -> ast::Node_id
        {
            return builder.variable(
                name, ast::Variable_kind::Local, range(column, static_cast<std::uint32_t>(name.size())));
        }

        auto integer(std::int64_t const value, std::uint32_t const column) -> ast::Node_id
        {
            return builder.integer(value, range(column, 1));
        }

        auto call(
            std::optional<ast::Node_id> const receiver,
            std::string_view const            name,
            std::vector<ast::Node_id>         arguments,
            lsp::Range const                  call_range) -> ast::Node_id
        {
            return builder.method_call(
                ast::node::Method_call {
                    .receiver        = receiver,
                    .name            = builder.name(name, call_range),
                    .arguments       = std::move(arguments),
                    .block           = std::nullopt,
                    .scope_qualified = false,
                },
                call_range);
        }

        auto variable_of(ast::Node_id const access) const -> ast::Variable_id
        {
            return std::get<ast::node::Variable_access>(db.ast.nodes[access].variant).variable;
        }
    };

    inline auto synth_id(syn::Node const node) -> syn::Synth_id
    {
        auto const id = syn::as_synth(node);
        REQUIRE(id.has_value());
        return id.value();
    }

    inline auto kinds(syn::Context& ctx, std::vector<syn::Node> const& nodes)
        -> std::vector<syn::Kind>
    {
        std::vector<syn::Kind> result;
        for (syn::Node const node : nodes) {
            result.push_back(syn::kind_of(ctx, synth_id(node)));
        }
        return result;
    }

    // Access to the temporary introduced by `introducer` at `slot`.
    inline auto temporary(syn::Node const introducer, std::int32_t const slot) -> syn::Kind
    {
        return syn::kind::Local_variable_access {
            syn::Synth_variable { .introducer = introducer, .slot = slot },
        };
    }

    inline auto method_call(
        syn::Context& ctx, std::string_view const name, bool const setter, std::uint32_t const arity)
        -> syn::Kind
    {
        auto const id = ctx.registry.find_method_call(syn::Method_signature {
            .name   = ctx.db.string_pool.make(name),
            .setter = setter,
            .arity  = arity,
        });
        REQUIRE(id.has_value());
        return syn::kind::Method_call { .id = id.value() };
    }

    inline auto integer(std::int64_t const value) -> syn::Kind
    {
        return syn::kind::Integer_literal { .value = value };
    }

    // Every node reachable from `root` through desugared forms and children.
    inline auto reachable(syn::Context& ctx, syn::Node const root) -> std::vector<syn::Node>
    {
        std::vector<syn::Node> nodes { root };
        for (std::size_t i = 0; i != nodes.size(); ++i) {
            syn::Node const node = nodes[i];
            if (auto const form = syn::desugared(ctx, node)) {
                nodes.push_back(form.value());
            }
            nodes.append_range(syn::children(ctx, node));
        }
        return nodes;
    }

    // Number of edges on the longest path from `root` through desugared forms and children.
    inline auto tree_depth(syn::Context& ctx, syn::Node const root) -> std::size_t
    {
        std::size_t depth = 0;
        if (auto const form = syn::desugared(ctx, root)) {
            depth = std::max(depth, tree_depth(ctx, form.value()) + 1);
        }
        for (syn::Node const child : syn::children(ctx, root)) {
            depth = std::max(depth, tree_depth(ctx, child) + 1);
        }
        return depth;
    }

} // namespace du::test

#endif // DULCE_LIBSYNTH_TESTS_SYNTH_TEST
