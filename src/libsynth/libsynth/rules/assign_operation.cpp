#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

/*

    x op= y

    (operation, -1)     assignment
      0                   x
      1                   binary operation op
        0                   x, as a fresh access of the same variable
        1                   y

    recv.name(args) op= y

    (operation, -1)     statement sequence
      0                   assignment t0 = recv
      1..n                assignment ti = args[i-1]
      n+1                 assignment tn+1 = binary operation op
                            0   method call name (arity n): t0..tn
                            1   y
      n+2                 method call name= (setter, arity n+1): t0..tn+1
      n+3                 tn+1

    where ti is the variable introduced by the original operation at slot i.

*/

using namespace du;
using namespace du::syn;

namespace {
    struct Variable_target {
        ast::Node_id                       operation;
        ast::node::Assign_operation const* assign {};
        ast::node::Variable_access const*  access {};
    };

    struct Call_target {
        ast::Node_id                       operation;
        ast::node::Assign_operation const* assign {};
        ast::Node_id                       call_id;
        ast::node::Method_call const*      call {};

        [[nodiscard]] auto argument_count() const -> std::size_t
        {
            return call->arguments.size();
        }
    };

    // A statement of the sequence a call target desugars to.
    struct Statement {
        Call_target target;
        std::size_t index {};
    };

    auto access_kind(Context const& ctx, ast::Variable_id const variable) -> Kind
    {
        switch (ctx.db.ast.variables[variable].kind) {
        case ast::Variable_kind::Local:    return kind::Local_variable_access { .variable = variable };
        case ast::Variable_kind::Instance: return kind::Instance_variable_access { .variable = variable };
        case ast::Variable_kind::Class:    return kind::Class_variable_access { .variable = variable };
        case ast::Variable_kind::Global:   return kind::Global_variable_access { .variable = variable };
        default:                           cpputil::unreachable();
        }
    }

    auto variable_target(Context& ctx, Node const node) -> std::optional<Variable_target>
    {
        auto const* const assign = real_as<ast::node::Assign_operation>(ctx, node);
        if (assign == nullptr) {
            return std::nullopt;
        }
        auto const* const access
            = std::get_if<ast::node::Variable_access>(&ctx.db.ast.nodes[assign->left].variant);
        if (access == nullptr) {
            return std::nullopt;
        }
        return Variable_target {
            .operation = as_real(node).value(),
            .assign    = assign,
            .access    = access,
        };
    }

    auto variable_assignment_target(Context& ctx, Node const node) -> std::optional<Variable_target>
    {
        return address_of<kind::Assign>(ctx, node, -1).and_then(
            [&](Synth_key const& key) { return variable_target(ctx, key.parent); });
    }

    auto variable_binary_target(Context& ctx, Node const node) -> std::optional<Variable_target>
    {
        return address_of<kind::Binary>(ctx, node, 1).and_then(
            [&](Synth_key const& key) -> std::optional<Variable_target> {
                auto target = variable_assignment_target(ctx, key.parent);
                if (target.has_value() and key.kind == Kind(kind::Binary { target->assign->op })) {
                    return target;
                }
                return std::nullopt;
            });
    }

    auto variable_access_target(Context& ctx, Node const node) -> std::optional<Variable_target>
    {
        return address(ctx, node).and_then([&](Synth_key const& key) -> std::optional<Variable_target> {
            if (key.index != 0) {
                return std::nullopt;
            }
            auto target = variable_binary_target(ctx, key.parent);
            if (target.has_value() and key.kind == access_kind(ctx, target->access->variable)) {
                return target;
            }
            return std::nullopt;
        });
    }

    auto is_call_target(Context& ctx, ast::Node_id const node) -> bool
    {
        auto const* const call = real_as<ast::node::Method_call>(ctx, node);
        if (call == nullptr or not ast::has_receiver(*call)) {
            return false;
        }
        return ast::parent(ctx.db.ast, node)
            .transform([&](ast::Node_id const parent) {
                auto const* const assign = real_as<ast::node::Assign_operation>(ctx, parent);
                return assign != nullptr and assign->left == node;
            })
            .value_or(false);
    }

    auto call_target(Context& ctx, Node const node) -> std::optional<Call_target>
    {
        auto const* const assign = real_as<ast::node::Assign_operation>(ctx, node);
        if (assign == nullptr or not is_call_target(ctx, assign->left)) {
            return std::nullopt;
        }
        return Call_target {
            .operation = as_real(node).value(),
            .assign    = assign,
            .call_id   = assign->left,
            .call = std::get_if<ast::node::Method_call>(&ctx.db.ast.nodes[assign->left].variant),
        };
    }

    auto getter_signature(Call_target const& target) -> Method_signature
    {
        return Method_signature {
            .name   = target.call->name.id,
            .setter = false,
            .arity  = cpputil::num::safe_cast<std::uint32_t>(target.argument_count()),
        };
    }

    auto setter_signature(Context& ctx, Call_target const& target) -> Method_signature
    {
        return Method_signature {
            .name   = setter_name(ctx, target.call->name.id),
            .setter = true,
            .arity  = cpputil::num::safe_cast<std::uint32_t>(target.argument_count() + 1),
        };
    }

    auto sequence_target(Context& ctx, Node const node) -> std::optional<Call_target>
    {
        return address_of<kind::Stmt_sequence>(ctx, node, -1).and_then(
            [&](Synth_key const& key) { return call_target(ctx, key.parent); });
    }

    // Finds the statement `node` is, if its kind matches the kind of that statement.
    auto statement(Context& ctx, Node const node) -> std::optional<Statement>
    {
        return address(ctx, node).and_then([&](Synth_key const& key) -> std::optional<Statement> {
            if (key.index < 0) {
                return std::nullopt;
            }
            auto target = sequence_target(ctx, key.parent);
            if (not target.has_value()) {
                return std::nullopt;
            }
            std::size_t const index = to_size(key.index);
            std::size_t const n     = target->argument_count();
            bool const        matches
                = index <= n + 1
                    ? std::holds_alternative<kind::Assign>(key.kind)
                    : index == n + 2
                          and key.kind == method_call_kind(ctx, setter_signature(ctx, *target));
            if (not matches) {
                return std::nullopt;
            }
            return Statement { .target = target.value(), .index = index };
        });
    }

    auto binary_target(Context& ctx, Node const node) -> std::optional<Call_target>
    {
        return address_of<kind::Binary>(ctx, node, 1).and_then(
            [&](Synth_key const& key) -> std::optional<Call_target> {
                auto const computation = statement(ctx, key.parent);
                if (computation.has_value()
                    and computation->index == computation->target.argument_count() + 1
                    and key.kind == Kind(kind::Binary { computation->target.assign->op })) {
                    return computation->target;
                }
                return std::nullopt;
            });
    }

    auto getter_target(Context& ctx, Node const node) -> std::optional<Call_target>
    {
        return address_of<kind::Method_call>(ctx, node, 0).and_then(
            [&](Synth_key const& key) -> std::optional<Call_target> {
                auto target = binary_target(ctx, key.parent);
                if (target.has_value()
                    and key.kind == method_call_kind(ctx, getter_signature(target.value()))) {
                    return target;
                }
                return std::nullopt;
            });
    }

    // The expression captured by the statement at `index`.
    auto captured(Context& ctx, Call_target const& target, std::size_t const index) -> Node
    {
        if (index == 0) {
            return required_child(ctx, target.call_id, 0);
        }
        return target.call->arguments.at(index - 1);
    }

    // Accesses to t0..t`count - 1`.
    auto temporary_child(Call_target const& target, std::int32_t const index, std::size_t const count)
        -> std::optional<Child>
    {
        if (index >= 0 and to_size(index) < count) {
            return local(target.operation, index);
        }
        return std::nullopt;
    }

    auto statement_child(Context& ctx, Statement const& statement, std::int32_t const index)
        -> std::optional<Child>
    {
        std::size_t const n = statement.target.argument_count();
        if (statement.index <= n) {
            switch (index) {
            case 0:  return local(statement.target.operation, to_index(statement.index));
            case 1:  return child_ref(captured(ctx, statement.target, statement.index));
            default: return std::nullopt;
            }
        }
        if (statement.index == n + 1) {
            switch (index) {
            case 0:  return local(statement.target.operation, to_index(n + 1));
            case 1:  return synth(kind::Binary { statement.target.assign->op });
            default: return std::nullopt;
            }
        }
        return temporary_child(statement.target, index, n + 2);
    }
} // namespace

auto du::syn::rule::Variable_assign_operation::child(
    Context& ctx, Node const parent, std::int32_t const index) const -> std::optional<Child>
{
    if (index == -1) {
        return variable_target(ctx, parent).transform(
            [](Variable_target const&) { return synth(kind::Assign {}); });
    }
    if (auto const target = variable_assignment_target(ctx, parent)) {
        switch (index) {
        case 0:  return Real_child_ref { .node = target->assign->left };
        case 1:  return synth(kind::Binary { target->assign->op });
        default: return std::nullopt;
        }
    }
    if (auto const target = variable_binary_target(ctx, parent)) {
        switch (index) {
        case 0:  return synth(access_kind(ctx, target->access->variable));
        case 1:  return Real_child_ref { .node = target->assign->right };
        default: return std::nullopt;
        }
    }
    return std::nullopt;
}

auto du::syn::rule::Variable_assign_operation::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    if (auto const target = variable_binary_target(ctx, node)) {
        return target->assign->operator_range;
    }
    if (auto const target = variable_access_target(ctx, node)) {
        return real_range(ctx, target->assign->left);
    }
    return std::nullopt;
}

auto du::syn::rule::Setter_assign_operation::child(
    Context& ctx, Node const parent, std::int32_t const index) const -> std::optional<Child>
{
    if (index == -1) {
        return call_target(ctx, parent).transform(
            [](Call_target const&) { return synth(kind::Stmt_sequence {}); });
    }
    if (index < 0) {
        return std::nullopt;
    }
    if (auto const target = sequence_target(ctx, parent)) {
        std::size_t const n = target->argument_count();
        if (to_size(index) <= n + 1) {
            return synth(kind::Assign {});
        }
        if (to_size(index) == n + 2) {
            return synth(method_call_kind(ctx, setter_signature(ctx, target.value())));
        }
        if (to_size(index) == n + 3) {
            return local(target->operation, to_index(n + 1));
        }
        return std::nullopt;
    }
    if (auto const stmt = statement(ctx, parent)) {
        return statement_child(ctx, stmt.value(), index);
    }
    if (auto const target = binary_target(ctx, parent)) {
        switch (index) {
        case 0:  return synth(method_call_kind(ctx, getter_signature(target.value())));
        case 1:  return Real_child_ref { .node = target->assign->right };
        default: return std::nullopt;
        }
    }
    if (auto const target = getter_target(ctx, parent)) {
        return temporary_child(target.value(), index, target->argument_count() + 1);
    }
    return std::nullopt;
}

auto du::syn::rule::Setter_assign_operation::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    if (auto const stmt = statement(ctx, node)) {
        std::size_t const n = stmt->target.argument_count();
        if (stmt->index <= n) {
            return syn::location(ctx, captured(ctx, stmt->target, stmt->index));
        }
        if (stmt->index == n + 2) {
            return real_range(ctx, stmt->target.call_id);
        }
        return std::nullopt;
    }
    if (auto const target = binary_target(ctx, node)) {
        return target->assign->operator_range;
    }
    if (auto const target = getter_target(ctx, node)) {
        return real_range(ctx, target->call_id);
    }
    return std::nullopt;
}

auto du::syn::rule::Setter_assign_operation::declares_variable(
    Context& ctx, Node const node, std::int32_t const slot) const -> bool
{
    return slot >= 0 and call_target(ctx, node)
                             .transform([&](Call_target const& target) {
                                 return to_size(slot) <= target.argument_count() + 1;
                             })
                             .value_or(false);
}

auto du::syn::rule::Setter_assign_operation::variable_slot_limit(
    Context& ctx, Node const node) const -> std::int32_t
{
    return call_target(ctx, node)
        .transform([](Call_target const& target) { return to_index(target.argument_count() + 2); })
        .value_or(0);
}

auto du::syn::rule::Setter_assign_operation::excludes(Context& ctx, ast::Node_id const node) const
    -> bool
{
    return is_call_target(ctx, node);
}

void du::syn::rule::Setter_assign_operation::demands(
    Context& ctx, ast::Node_id const node, Demands& demands) const
{
    if (auto const target = call_target(ctx, node)) {
        demands.method_calls.push_back(getter_signature(target.value()));
        demands.method_calls.push_back(setter_signature(ctx, target.value()));
    }
}
