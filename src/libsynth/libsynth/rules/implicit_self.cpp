#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

using namespace du;
using namespace du::syn;

namespace {
    // Whether the receiver slot of `node` is filled with an implicit `self`.
    auto receives_implicit_self(Context& ctx, Node const node) -> bool
    {
        if (real_as<ast::node::Identifier_call>(ctx, node) != nullptr) {
            return true;
        }
        auto const* const call = real_as<ast::node::Method_call>(ctx, node);
        return call != nullptr and not call->receiver.has_value() and not call->scope_qualified;
    }
} // namespace

auto du::syn::rule::Implicit_self::child(
    Context& ctx, Node const parent, std::int32_t const index) const -> std::optional<Child>
{
    if (index != 0 or not receives_implicit_self(ctx, parent)) {
        return std::nullopt;
    }
    ast::Node const& call = ctx.db.ast.nodes[as_real(parent).value()];
    return synth(kind::Self_access { .self_scope = ast::self_scope(ctx.db.ast, call.scope) });
}

auto du::syn::rule::Implicit_self::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    return address_of<kind::Self_access>(ctx, node, 0)
        .and_then([&](Synth_key const& key) -> std::optional<lsp::Range> {
            if (not receives_implicit_self(ctx, key.parent)) {
                return std::nullopt;
            }
            return lsp::to_range_0(real_range(ctx, as_real(key.parent).value()).start);
        });
}
