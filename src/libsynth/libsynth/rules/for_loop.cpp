#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

/*

    for pattern in iterable
        body
    end

    (for, -1)           method call each (arity 0)
      0                   iterable
      1                   brace block
        0                   parameter
          0                   tmp
        1                   assignment
          0                   pattern
          1                   tmp
        2..                 body statements

    where tmp is the variable introduced by the parameter at slot 0. The
    block scopes only tmp, variables bound by the pattern outlive the loop.

*/

using namespace du;
using namespace du::syn;

namespace {
    auto each_signature(Context& ctx) -> Method_signature
    {
        return Method_signature { .name = ctx.db.string_pool.make("each"), .setter = false, .arity = 0 };
    }

    auto loop_of_call(Context& ctx, Node const node) -> ast::node::For_loop const*
    {
        auto const key = address_of<kind::Method_call>(ctx, node, -1);
        if (not key.has_value()) {
            return nullptr;
        }
        auto const* const loop = real_as<ast::node::For_loop>(ctx, key->parent);
        return loop != nullptr and key->kind == method_call_kind(ctx, each_signature(ctx)) ? loop
                                                                                           : nullptr;
    }

    // The loop whose synthetic block is `node`.
    auto loop_of_block(Context& ctx, Node const node) -> ast::node::For_loop const*
    {
        auto const key = address_of<kind::Brace_block>(ctx, node, 1);
        return key.has_value() ? loop_of_call(ctx, key->parent) : nullptr;
    }

    template <typename K>
    auto loop_of_block_child(Context& ctx, Node const node, std::int32_t const index)
        -> ast::node::For_loop const*
    {
        auto const key = address_of<K>(ctx, node, index);
        return key.has_value() ? loop_of_block(ctx, key->parent) : nullptr;
    }

    auto loop_of_parameter(Context& ctx, Node const node) -> ast::node::For_loop const*
    {
        return loop_of_block_child<kind::Simple_parameter>(ctx, node, 0);
    }

    auto loop_of_assignment(Context& ctx, Node const node) -> ast::node::For_loop const*
    {
        return loop_of_block_child<kind::Assign>(ctx, node, 1);
    }

    auto body_statements(Context const& ctx, ast::node::For_loop const& loop)
        -> std::vector<ast::Node_id> const&
    {
        return std::get<ast::node::Stmt_sequence>(ctx.db.ast.nodes[loop.body].variant).statements;
    }

    // The parameter of the block `node` belongs to.
    auto parameter_of(Context& ctx, Node const block) -> Node
    {
        return required_child(ctx, block, 0);
    }
} // namespace

auto du::syn::rule::For_loop::child(Context& ctx, Node const parent, std::int32_t const index) const
    -> std::optional<Child>
{
    if (index == -1) {
        if (real_as<ast::node::For_loop>(ctx, parent) != nullptr) {
            return synth(method_call_kind(ctx, each_signature(ctx)));
        }
        return std::nullopt;
    }
    if (auto const* const loop = loop_of_call(ctx, parent)) {
        switch (index) {
        case 0:  return Real_child_ref { .node = loop->iterable };
        case 1:  return synth(kind::Brace_block {});
        default: return std::nullopt;
        }
    }
    if (auto const* const loop = loop_of_block(ctx, parent)) {
        std::vector<ast::Node_id> const& statements = body_statements(ctx, *loop);
        if (index == 0) {
            return synth(kind::Simple_parameter {});
        }
        if (index == 1) {
            return synth(kind::Assign {});
        }
        if (index >= 2 and to_size(index) - 2 < statements.size()) {
            return Real_child_ref { .node = statements.at(to_size(index) - 2) };
        }
        return std::nullopt;
    }
    if (loop_of_parameter(ctx, parent) != nullptr) {
        return index == 0 ? std::optional(local(parent, 0)) : std::nullopt;
    }
    if (auto const* const loop = loop_of_assignment(ctx, parent)) {
        switch (index) {
        case 0: return Real_child_ref { .node = loop->pattern };
        case 1: {
            Node const block = ctx.synth.key(as_synth(parent).value()).parent;
            return local(parameter_of(ctx, block), 0);
        }
        default: return std::nullopt;
        }
    }
    return std::nullopt;
}

auto du::syn::rule::For_loop::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    auto const* loop = loop_of_parameter(ctx, node);
    if (loop == nullptr) {
        loop = loop_of_assignment(ctx, node);
    }
    if (loop == nullptr) {
        return std::nullopt;
    }
    return real_range(ctx, loop->pattern);
}

auto du::syn::rule::For_loop::declares_variable(
    Context& ctx, Node const node, std::int32_t const slot) const -> bool
{
    return slot == 0 and loop_of_parameter(ctx, node) != nullptr;
}

auto du::syn::rule::For_loop::variable_slot_limit(Context&, Node) const -> std::int32_t
{
    return 1;
}

auto du::syn::rule::For_loop::excludes(Context& ctx, ast::Node_id const node) const -> bool
{
    return ast::parent(ctx.db.ast, node)
        .transform([&](ast::Node_id const parent) {
            auto const* const loop = real_as<ast::node::For_loop>(ctx, parent);
            return loop != nullptr and loop->body == node;
        })
        .value_or(false);
}

void du::syn::rule::For_loop::demands(Context& ctx, ast::Node_id const node, Demands& demands) const
{
    if (real_as<ast::node::For_loop>(ctx, node) != nullptr) {
        demands.method_calls.push_back(each_signature(ctx));
    }
}
