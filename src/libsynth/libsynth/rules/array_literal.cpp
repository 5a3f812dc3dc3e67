#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

using namespace du;
using namespace du::syn;

namespace {
    constexpr std::string_view array_constant = "::Array";

    auto constructor_signature(Context& ctx, ast::node::Array_literal const& literal)
        -> Method_signature
    {
        return Method_signature {
            .name   = ctx.db.string_pool.make("[]"),
            .setter = false,
            .arity  = cpputil::num::safe_cast<std::uint32_t>(literal.elements.size() + 1),
        };
    }

    auto constructor_call(Context& ctx, Node const node) -> ast::node::Array_literal const*
    {
        auto const key = address_of<kind::Method_call>(ctx, node, -1);
        if (not key.has_value()) {
            return nullptr;
        }
        auto const* const literal = real_as<ast::node::Array_literal>(ctx, key->parent);
        if (literal != nullptr
            and key->kind == method_call_kind(ctx, constructor_signature(ctx, *literal))) {
            return literal;
        }
        return nullptr;
    }
} // namespace

auto du::syn::rule::Array_literal::child(
    Context& ctx, Node const parent, std::int32_t const index) const -> std::optional<Child>
{
    if (index == -1) {
        if (auto const* const literal = real_as<ast::node::Array_literal>(ctx, parent)) {
            return synth(method_call_kind(ctx, constructor_signature(ctx, *literal)));
        }
        return std::nullopt;
    }
    if (auto const* const literal = constructor_call(ctx, parent)) {
        if (index == 0) {
            return synth(kind::Constant_read { .name = ctx.db.string_pool.make(array_constant) });
        }
        if (index > 0 and to_size(index) <= literal->elements.size()) {
            return Real_child_ref { .node = literal->elements.at(to_size(index) - 1) };
        }
    }
    return std::nullopt;
}

void du::syn::rule::Array_literal::demands(
    Context& ctx, ast::Node_id const node, Demands& demands) const
{
    if (auto const* const literal = real_as<ast::node::Array_literal>(ctx, node)) {
        demands.method_calls.push_back(constructor_signature(ctx, *literal));
        demands.constants.push_back(ctx.db.string_pool.make(array_constant));
    }
}
