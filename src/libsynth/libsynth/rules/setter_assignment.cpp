#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

/*

    recv.attr(args) = value

    (assignment, -1)    statement sequence
      0                   method call attr= (setter, arity n+1)
        0                   recv
        1..n                args
        n+1                 assignment
          0                   tmp
          1                   value
      1                   tmp

    where tmp is the variable introduced by the original assignment at slot 0.

*/

using namespace du;
using namespace du::syn;

namespace {
    struct Target {
        Node                          assignment;
        ast::Node_id                  call_id;
        ast::node::Method_call const* call {};
    };

    auto signature(Context& ctx, ast::node::Method_call const& call) -> Method_signature
    {
        return Method_signature {
            .name   = setter_name(ctx, call.name.id),
            .setter = true,
            .arity  = cpputil::num::safe_cast<std::uint32_t>(call.arguments.size() + 1),
        };
    }

    auto is_setter_call(Context& ctx, ast::Node_id const node) -> ast::node::Method_call const*
    {
        auto const* const call = real_as<ast::node::Method_call>(ctx, node);
        return call != nullptr and ast::has_receiver(*call) ? call : nullptr;
    }

    auto assignment_target(Context& ctx, Node const assignment) -> std::optional<Target>
    {
        if (not is_assignment(ctx, assignment)) {
            return std::nullopt;
        }
        return real_child(ctx, assignment, 0).and_then(
            [&](ast::Node_id const left) -> std::optional<Target> {
                if (auto const* const call = is_setter_call(ctx, left)) {
                    return Target { .assignment = assignment, .call_id = left, .call = call };
                }
                return std::nullopt;
            });
    }

    auto sequence_target(Context& ctx, Node const node) -> std::optional<Target>
    {
        return address_of<kind::Stmt_sequence>(ctx, node, -1).and_then(
            [&](Synth_key const& key) { return assignment_target(ctx, key.parent); });
    }

    auto call_target(Context& ctx, Node const node) -> std::optional<Target>
    {
        return address_of<kind::Method_call>(ctx, node, 0).and_then(
            [&](Synth_key const& key) -> std::optional<Target> {
                auto target = sequence_target(ctx, key.parent);
                if (target.has_value()
                    and key.kind == method_call_kind(ctx, signature(ctx, *target->call))) {
                    return target;
                }
                return std::nullopt;
            });
    }

    auto inner_assignment_target(Context& ctx, Node const node) -> std::optional<Target>
    {
        return address(ctx, node).and_then([&](Synth_key const& key) -> std::optional<Target> {
            if (key.index < 0 or not std::holds_alternative<kind::Assign>(key.kind)) {
                return std::nullopt;
            }
            auto target = call_target(ctx, key.parent);
            if (target.has_value() and to_size(key.index) == target->call->arguments.size() + 1) {
                return target;
            }
            return std::nullopt;
        });
    }
} // namespace

auto du::syn::rule::Setter_assignment::child(
    Context& ctx, Node const parent, std::int32_t const index) const -> std::optional<Child>
{
    if (index == -1) {
        return assignment_target(ctx, parent).transform(
            [](Target const&) { return synth(kind::Stmt_sequence {}); });
    }
    if (index < 0) {
        return std::nullopt;
    }
    if (auto const target = sequence_target(ctx, parent)) {
        switch (index) {
        case 0:  return synth(method_call_kind(ctx, signature(ctx, *target->call)));
        case 1:  return local(target->assignment, 0);
        default: return std::nullopt;
        }
    }
    if (auto const target = call_target(ctx, parent)) {
        std::size_t const argument_count = target->call->arguments.size();
        if (index == 0) {
            return child_ref(required_child(ctx, target->call_id, 0));
        }
        if (to_size(index) <= argument_count) {
            return Real_child_ref { .node = target->call->arguments.at(to_size(index) - 1) };
        }
        if (to_size(index) == argument_count + 1) {
            return synth(kind::Assign {});
        }
        return std::nullopt;
    }
    if (auto const target = inner_assignment_target(ctx, parent)) {
        switch (index) {
        case 0:  return local(target->assignment, 0);
        case 1:  return child_ref(required_child(ctx, target->assignment, 1));
        default: return std::nullopt;
        }
    }
    return std::nullopt;
}

auto du::syn::rule::Setter_assignment::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    return call_target(ctx, node).transform(
        [&](Target const& target) { return real_range(ctx, target.call_id); });
}

auto du::syn::rule::Setter_assignment::declares_variable(
    Context& ctx, Node const node, std::int32_t const slot) const -> bool
{
    return slot == 0 and assignment_target(ctx, node).has_value();
}

auto du::syn::rule::Setter_assignment::variable_slot_limit(Context&, Node) const -> std::int32_t
{
    return 1;
}

auto du::syn::rule::Setter_assignment::excludes(Context& ctx, ast::Node_id const node) const
    -> bool
{
    return is_setter_call(ctx, node) != nullptr and ast::is_assignment_target(ctx.db.ast, node);
}

void du::syn::rule::Setter_assignment::demands(
    Context& ctx, ast::Node_id const node, Demands& demands) const
{
    if (excludes(ctx, node)) {
        demands.method_calls.push_back(signature(ctx, *is_setter_call(ctx, node)));
    }
}
