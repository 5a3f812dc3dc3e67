#include <libutl/utilities.hpp>
#include <libsynth/internals.hpp>

/*

    e0, e1, ..., ek-1 = value       with the splat element at r, or r = k

    (assignment, -1)    statement sequence
      0                   assignment
        0                   tmp
        1                   splat
          0                   value
      j+1                 assignment
        0                   ej, or the operand of the splat element
        1                   method call [] (arity 1)
          0                   tmp
          1                   j         if j < r
                              r..r-k    if j = r
                              j-k       if j > r

*/

using namespace du;
using namespace du::syn;

namespace {
    struct Target {
        Node                               assignment;
        ast::Node_id                       lhs_id;
        ast::node::Destructured_lhs const* lhs {};

        [[nodiscard]] auto element_count() const -> std::size_t
        {
            return lhs->elements.size();
        }
    };

    // A statement of the sequence a target desugars to.
    struct Statement {
        Target      target;
        std::size_t index {};
    };

    auto read_signature(Context& ctx) -> Method_signature
    {
        return Method_signature { .name = ctx.db.string_pool.make("[]"), .setter = false, .arity = 1 };
    }

    auto rest_position(Context const& ctx, ast::node::Destructured_lhs const& lhs) -> std::size_t
    {
        return ast::rest_index(ctx.db.ast, lhs).value_or(lhs.elements.size());
    }

    auto signed_index(std::size_t const value) -> std::int64_t
    {
        return cpputil::num::safe_cast<std::int64_t>(value);
    }

    auto assignment_target(Context& ctx, Node const assignment) -> std::optional<Target>
    {
        if (not is_assignment(ctx, assignment)) {
            return std::nullopt;
        }
        return real_child(ctx, assignment, 0).and_then(
            [&](ast::Node_id const left) -> std::optional<Target> {
                if (auto const* const lhs = real_as<ast::node::Destructured_lhs>(ctx, left)) {
                    return Target { .assignment = assignment, .lhs_id = left, .lhs = lhs };
                }
                return std::nullopt;
            });
    }

    auto sequence_target(Context& ctx, Node const node) -> std::optional<Target>
    {
        return address_of<kind::Stmt_sequence>(ctx, node, -1).and_then(
            [&](Synth_key const& key) { return assignment_target(ctx, key.parent); });
    }

    auto statement(Context& ctx, Node const node) -> std::optional<Statement>
    {
        return address(ctx, node).and_then([&](Synth_key const& key) -> std::optional<Statement> {
            if (key.index < 0 or not std::holds_alternative<kind::Assign>(key.kind)) {
                return std::nullopt;
            }
            auto target = sequence_target(ctx, key.parent);
            if (target.has_value() and to_size(key.index) <= target->element_count()) {
                return Statement { .target = target.value(), .index = to_size(key.index) };
            }
            return std::nullopt;
        });
    }

    auto capture_splat_target(Context& ctx, Node const node) -> std::optional<Target>
    {
        return address_of<kind::Splat>(ctx, node, 1).and_then(
            [&](Synth_key const& key) -> std::optional<Target> {
                auto const capture = statement(ctx, key.parent);
                if (capture.has_value() and capture->index == 0) {
                    return capture->target;
                }
                return std::nullopt;
            });
    }

    // The element read `node` is, with the element index.
    auto read(Context& ctx, Node const node) -> std::optional<Statement>
    {
        return address_of<kind::Method_call>(ctx, node, 1).and_then(
            [&](Synth_key const& key) -> std::optional<Statement> {
                auto element = statement(ctx, key.parent);
                if (element.has_value() and element->index != 0
                    and key.kind == method_call_kind(ctx, read_signature(ctx))) {
                    return element;
                }
                return std::nullopt;
            });
    }

    // The index of element `j`, or the range kind for the splat element.
    auto index_kind(Target const& target, std::size_t const j, std::size_t const r)
        -> std::optional<Kind>
    {
        std::int64_t const k = signed_index(target.element_count());
        if (j < r) {
            return integer_kind(signed_index(j));
        }
        if (j == r) {
            return kind::Range_literal { .inclusive = true };
        }
        return integer_kind(signed_index(j) - k);
    }

    // The range read by the splat element `node`.
    auto rest_range(Context& ctx, Node const node) -> std::optional<Target>
    {
        return address_of<kind::Range_literal>(ctx, node, 1).and_then(
            [&](Synth_key const& key) -> std::optional<Target> {
                auto const element = read(ctx, key.parent);
                if (element.has_value()
                    and element->index - 1 == rest_position(ctx, *element->target.lhs)) {
                    return element->target;
                }
                return std::nullopt;
            });
    }

    // The node that element `j` binds.
    auto element_target(Context& ctx, Target const& target, std::size_t const j) -> ast::Node_id
    {
        ast::Node_id const element = target.lhs->elements.at(j);
        if (auto const* const splat = real_as<ast::node::Splat>(ctx, element)) {
            return splat->operand;
        }
        return element;
    }

    void demand_integer(Demands& demands, std::int64_t const value)
    {
        if (not std::ranges::contains(demands.integers, value)) {
            demands.integers.push_back(value);
        }
    }
} // namespace

auto du::syn::rule::Destructured_assignment::child(
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
        if (to_size(index) <= target->element_count()) {
            return synth(kind::Assign {});
        }
        return std::nullopt;
    }
    if (auto const stmt = statement(ctx, parent)) {
        if (stmt->index == 0) {
            switch (index) {
            case 0:  return local(stmt->target.assignment, 0);
            case 1:  return synth(kind::Splat {});
            default: return std::nullopt;
            }
        }
        switch (index) {
        case 0:  return Real_child_ref { .node = element_target(ctx, stmt->target, stmt->index - 1) };
        case 1:  return synth(method_call_kind(ctx, read_signature(ctx)));
        default: return std::nullopt;
        }
    }
    if (auto const target = capture_splat_target(ctx, parent)) {
        if (index == 0) {
            return child_ref(required_child(ctx, target->assignment, 1));
        }
        return std::nullopt;
    }
    if (auto const element = read(ctx, parent)) {
        switch (index) {
        case 0: return local(element->target.assignment, 0);
        case 1:
            return index_kind(
                       element->target,
                       element->index - 1,
                       rest_position(ctx, *element->target.lhs))
                .transform(synth);
        default: return std::nullopt;
        }
    }
    if (auto const target = rest_range(ctx, parent)) {
        std::int64_t const r = signed_index(rest_position(ctx, *target->lhs));
        std::int64_t const k = signed_index(target->element_count());
        switch (index) {
        case 0:  return integer_kind(r).transform(synth);
        case 1:  return integer_kind(r - k).transform(synth);
        default: return std::nullopt;
        }
    }
    return std::nullopt;
}

auto du::syn::rule::Destructured_assignment::location(Context& ctx, Synth_id const node) const
    -> std::optional<lsp::Range>
{
    return statement(ctx, node).transform([&](Statement const& stmt) {
        if (stmt.index == 0) {
            return syn::location(ctx, required_child(ctx, stmt.target.assignment, 1));
        }
        return real_range(ctx, stmt.target.lhs->elements.at(stmt.index - 1));
    });
}

auto du::syn::rule::Destructured_assignment::declares_variable(
    Context& ctx, Node const node, std::int32_t const slot) const -> bool
{
    return slot == 0 and assignment_target(ctx, node).has_value();
}

auto du::syn::rule::Destructured_assignment::variable_slot_limit(Context&, Node) const
    -> std::int32_t
{
    return 1;
}

auto du::syn::rule::Destructured_assignment::excludes(Context& ctx, ast::Node_id const node) const
    -> bool
{
    return real_as<ast::node::Destructured_lhs>(ctx, node) != nullptr;
}

void du::syn::rule::Destructured_assignment::demands(
    Context& ctx, ast::Node_id const node, Demands& demands) const
{
    auto const* const lhs = real_as<ast::node::Destructured_lhs>(ctx, node);
    if (lhs == nullptr) {
        return;
    }
    demands.method_calls.push_back(read_signature(ctx));

    std::int64_t const k = signed_index(lhs->elements.size());
    std::int64_t const r = signed_index(rest_position(ctx, *lhs));
    for (std::int64_t j = 0; j != k; ++j) {
        if (j < r) {
            demand_integer(demands, j);
        }
        else if (j == r) {
            demand_integer(demands, r);
            demand_integer(demands, r - k);
        }
        else {
            demand_integer(demands, j - k);
        }
    }
}
