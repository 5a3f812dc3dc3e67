#include <libutl/utilities.hpp>
#include <libcompiler/ast/ast.hpp>
#include <libcompiler/db.hpp>

using namespace du;

namespace {
    auto scope_of(ast::Node_variant const& variant) -> std::optional<ast::Scope_id>
    {
        auto const visitor = utl::Overload {
            [](ast::node::Toplevel const& node) { return std::optional(node.scope); },
            [](ast::node::Module const& node) { return std::optional(node.scope); },
            [](ast::node::Class const& node) { return std::optional(node.scope); },
            [](ast::node::Method const& node) { return std::optional(node.scope); },
            [](ast::node::Block const& node) { return std::optional(node.scope); },
            [](auto const&) { return std::optional<ast::Scope_id>(); },
        };
        return std::visit(visitor, variant);
    }

    void append(std::vector<std::optional<ast::Node_id>>& slots, std::vector<ast::Node_id> const& ids)
    {
        slots.append_range(ids);
    }
} // namespace

auto du::ast::binary_operator_string(Binary_operator const op) -> std::string_view
{
    switch (op) {
    case Binary_operator::Add:         return "+";
    case Binary_operator::Sub:         return "-";
    case Binary_operator::Mul:         return "*";
    case Binary_operator::Div:         return "/";
    case Binary_operator::Modulo:      return "%";
    case Binary_operator::Exponent:    return "**";
    case Binary_operator::Left_shift:  return "<<";
    case Binary_operator::Right_shift: return ">>";
    case Binary_operator::Bitwise_and: return "&";
    case Binary_operator::Bitwise_or:  return "|";
    case Binary_operator::Bitwise_xor: return "^";
    case Binary_operator::Logical_and: return "&&";
    case Binary_operator::Logical_or:  return "||";
    default:                           cpputil::unreachable();
    }
}

auto du::ast::describe_variable_kind(Variable_kind const kind) -> std::string_view
{
    switch (kind) {
    case Variable_kind::Local:    return "local variable";
    case Variable_kind::Instance: return "instance variable";
    case Variable_kind::Class:    return "class variable";
    case Variable_kind::Global:   return "global variable";
    default:                      cpputil::unreachable();
    }
}

auto du::ast::describe_scope_kind(Scope_kind const kind) -> std::string_view
{
    switch (kind) {
    case Scope_kind::Toplevel: return "toplevel";
    case Scope_kind::Module:   return "module";
    case Scope_kind::Class:    return "class";
    case Scope_kind::Method:   return "method";
    case Scope_kind::Block:    return "block";
    default:                   cpputil::unreachable();
    }
}

auto du::ast::child_slots(Arena const& arena, Node_id const node_id)
    -> std::vector<std::optional<Node_id>>
{
    std::vector<std::optional<Node_id>> slots;
    auto const visitor = utl::Overload {
        [&](node::Toplevel const& node) { append(slots, node.statements); },
        [&](node::Module const& node) { append(slots, node.body); },
        [&](node::Class const& node) { append(slots, node.body); },
        [&](node::Method const& node) {
            append(slots, node.parameters);
            append(slots, node.body);
        },
        [&](node::Block const& node) {
            append(slots, node.parameters);
            append(slots, node.body);
        },
        [&](node::Stmt_sequence const& node) { append(slots, node.statements); },
        [&](node::Simple_parameter const& node) { slots.emplace_back(node.variable); },
        [&](node::Identifier_call const&) { slots.emplace_back(std::nullopt); },
        [&](node::Method_call const& node) {
            slots.push_back(node.receiver);
            append(slots, node.arguments);
            if (node.block.has_value()) {
                slots.push_back(node.block);
            }
        },
        [&](node::Assignment const& node) { slots.assign({ node.left, node.right }); },
        [&](node::Assign_operation const& node) { slots.assign({ node.left, node.right }); },
        [&](node::Destructured_lhs const& node) { append(slots, node.elements); },
        [&](node::Splat const& node) { slots.emplace_back(node.operand); },
        [&](node::Array_literal const& node) { append(slots, node.elements); },
        [&](node::For_loop const& node) {
            slots.assign({ node.pattern, node.iterable, node.body });
        },
        [&](node::Binary_operation const& node) { slots.assign({ node.left, node.right }); },
        [&](node::Constant_access const& node) {
            if (node.scope.has_value()) {
                slots.push_back(node.scope);
            }
        },
        [&](node::Variable_access const&) {},
        [&](node::Self_access const&) {},
        [&](db::Integer const&) {},
        [&](db::String const&) {},
    };
    std::visit(visitor, arena.nodes[node_id].variant);
    return slots;
}

auto du::ast::child(Arena const& arena, Node_id const node_id, std::int32_t const index)
    -> std::optional<Node_id>
{
    if (index < 0) {
        return std::nullopt;
    }
    auto const slots = child_slots(arena, node_id);
    auto const i     = cpputil::num::safe_cast<std::size_t>(index);
    return i < slots.size() ? slots[i] : std::nullopt;
}

auto du::ast::parent(Arena const& arena, Node_id const node_id) -> std::optional<Node_id>
{
    return arena.nodes[node_id].parent;
}

auto du::ast::index_in_parent(Arena const& arena, Node_id const node_id)
    -> std::optional<std::int32_t>
{
    return parent(arena, node_id).and_then([&](Node_id const parent_id) {
        auto const slots = child_slots(arena, parent_id);
        auto const it    = std::ranges::find(slots, std::optional(node_id));
        cpputil::always_assert(it != slots.end());
        return std::optional(cpputil::num::safe_cast<std::int32_t>(it - slots.begin()));
    });
}

auto du::ast::enclosing_scope(Arena const& arena, Node_id const node_id) -> Scope_id
{
    return arena.nodes[node_id].scope;
}

auto du::ast::introduced_scope(Arena const& arena, Node_id const node_id)
    -> std::optional<Scope_id>
{
    return scope_of(arena.nodes[node_id].variant);
}

auto du::ast::self_scope(Arena const& arena, Scope_id scope_id) -> Scope_id
{
    while (arena.scopes[scope_id].kind == Scope_kind::Block) {
        cpputil::always_assert(arena.scopes[scope_id].parent.has_value());
        scope_id = arena.scopes[scope_id].parent.value();
    }
    return scope_id;
}

auto du::ast::rest_index(Arena const& arena, node::Destructured_lhs const& lhs)
    -> std::optional<std::size_t>
{
    for (std::size_t i = 0; i != lhs.elements.size(); ++i) {
        if (std::holds_alternative<node::Splat>(arena.nodes[lhs.elements[i]].variant)) {
            return i;
        }
    }
    return std::nullopt;
}

auto du::ast::is_assignment_target(Arena const& arena, Node_id const node_id) -> bool
{
    auto const parent_id = parent(arena, node_id);
    if (not parent_id.has_value()) {
        return false;
    }
    auto const visitor = utl::Overload {
        [&](node::Assignment const& assignment) { return assignment.left == node_id; },
        [&](node::Destructured_lhs const&) { return true; },
        [&](node::Splat const&) {
            auto const grandparent = parent(arena, parent_id.value());
            return grandparent.has_value()
               and std::holds_alternative<node::Destructured_lhs>(
                       arena.nodes[grandparent.value()].variant);
        },
        [&](node::For_loop const& loop) { return loop.pattern == node_id; },
        [&](auto const&) { return false; },
    };
    return std::visit(visitor, arena.nodes[parent_id.value()].variant);
}

auto du::ast::has_receiver(node::Method_call const& call) noexcept -> bool
{
    return call.receiver.has_value() or not call.scope_qualified;
}

auto du::ast::describe(Arena const& arena, utl::String_pool const& pool, Node_id const node_id)
    -> std::string
{
    auto const visitor = utl::Overload {
        [](node::Toplevel const&) -> std::string { return "toplevel"; },
        [&](node::Module const& node) { return std::format("module {}", pool.get(node.name.id)); },
        [&](node::Class const& node) { return std::format("class {}", pool.get(node.name.id)); },
        [&](node::Method const& node) { return std::format("method {}", pool.get(node.name.id)); },
        [](node::Block const&) -> std::string { return "block"; },
        [](node::Stmt_sequence const&) -> std::string { return "statement sequence"; },
        [](node::Simple_parameter const&) -> std::string { return "parameter"; },
        [&](node::Identifier_call const& node) {
            return std::format("identifier call {}", pool.get(node.name.id));
        },
        [&](node::Method_call const& node) {
            return std::format("method call {}", pool.get(node.name.id));
        },
        [](node::Assignment const&) -> std::string { return "assignment"; },
        [](node::Assign_operation const& node) {
            return std::format("operator assignment {}=", binary_operator_string(node.op));
        },
        [](node::Destructured_lhs const&) -> std::string { return "destructured lhs"; },
        [](node::Splat const&) -> std::string { return "splat"; },
        [](node::Array_literal const&) -> std::string { return "array literal"; },
        [](node::For_loop const&) -> std::string { return "for loop"; },
        [](node::Binary_operation const& node) {
            return std::format("binary operation {}", binary_operator_string(node.op));
        },
        [&](node::Variable_access const& node) {
            Variable const& variable = arena.variables[node.variable];
            return std::format(
                "{} {}", describe_variable_kind(variable.kind), pool.get(variable.name.id));
        },
        [](node::Self_access const&) -> std::string { return "self"; },
        [&](node::Constant_access const& node) {
            return std::format("constant {}", pool.get(node.name.id));
        },
        [](db::Integer const& integer) { return std::format("integer {}", integer.value); },
        [&](db::String const& string) { return std::format("string {:?}", pool.get(string.id)); },
    };
    return std::visit(visitor, arena.nodes[node_id].variant);
}

du::ast::Builder::Builder(Arena& arena, utl::String_pool& pool) : m_arena(arena), m_pool(pool)
{
    m_scopes.push_back(m_arena.scopes.push(Scope {
        .variables = {},
        .node      = std::nullopt,
        .parent    = std::nullopt,
        .kind      = Scope_kind::Toplevel,
    }));
}

du::ast::Builder::Builder(db::Database& db) : Builder(db.ast, db.string_pool) {}

auto du::ast::Builder::current_scope() const -> Scope_id
{
    cpputil::always_assert(not m_scopes.empty());
    return m_scopes.back();
}

auto du::ast::Builder::enter_scope(Scope_kind const kind) -> Scope_id
{
    cpputil::always_assert(kind != Scope_kind::Toplevel);
    Scope_id const scope_id = m_arena.scopes.push(Scope {
        .variables = {},
        .node      = std::nullopt,
        .parent    = current_scope(),
        .kind      = kind,
    });
    m_scopes.push_back(scope_id);
    return scope_id;
}

auto du::ast::Builder::leave_scope(Scope_kind const kind) -> Scope_id
{
    cpputil::always_assert(m_scopes.size() > 1);
    Scope_id const scope_id = m_scopes.back();
    cpputil::always_assert(m_arena.scopes[scope_id].kind == kind);
    m_scopes.pop_back();
    return scope_id;
}

auto du::ast::Builder::push(Node_variant variant, lsp::Range const range) -> Node_id
{
    std::optional<Scope_id> const introduced = scope_of(variant);

    Node_id const node_id = m_arena.nodes.push(Node {
        .variant = std::move(variant),
        .range   = range,
        .scope   = current_scope(),
        .parent  = std::nullopt,
    });
    for (std::optional<Node_id> const& child_id : child_slots(m_arena, node_id)) {
        if (child_id.has_value()) {
            cpputil::always_assert(not m_arena.nodes[child_id.value()].parent.has_value());
            m_arena.nodes[child_id.value()].parent = node_id;
        }
    }
    if (introduced.has_value()) {
        cpputil::always_assert(not m_arena.scopes[introduced.value()].node.has_value());
        m_arena.scopes[introduced.value()].node = node_id;
    }
    return node_id;
}

auto du::ast::Builder::lookup_local(utl::String_id const id) const -> std::optional<Variable_id>
{
    std::optional<Scope_id> scope_id = current_scope();
    while (scope_id.has_value()) {
        Scope const& scope = m_arena.scopes[scope_id.value()];
        if (auto const it = scope.variables.find(id); it != scope.variables.end()) {
            if (m_arena.variables[it->second].kind == Variable_kind::Local) {
                return it->second;
            }
        }
        if (scope.kind != Scope_kind::Block) {
            break;
        }
        scope_id = scope.parent;
    }
    return std::nullopt;
}

auto du::ast::Builder::scope_for(Variable_kind const kind) const -> Scope_id
{
    switch (kind) {
    case Variable_kind::Local:    return current_scope();
    case Variable_kind::Instance: return self_scope(m_arena, current_scope());
    case Variable_kind::Global:   return m_scopes.front();
    case Variable_kind::Class:
    {
        Scope_id scope_id = self_scope(m_arena, current_scope());
        while (m_arena.scopes[scope_id].kind == Scope_kind::Method) {
            scope_id = self_scope(m_arena, m_arena.scopes[scope_id].parent.value());
        }
        return scope_id;
    }
    default: cpputil::unreachable();
    }
}

auto du::ast::Builder::name(std::string_view const string, lsp::Range const range) -> db::Name
{
    return db::Name { .id = m_pool.make(string), .range = range };
}

auto du::ast::Builder::variable_id(
    std::string_view const string, Variable_kind const kind, lsp::Range const range)
    -> Variable_id
{
    utl::String_id const id = m_pool.make(string);
    if (kind == Variable_kind::Local) {
        if (auto const existing = lookup_local(id)) {
            return existing.value();
        }
    }
    else if (auto const& variables = m_arena.scopes[scope_for(kind)].variables;
             variables.contains(id)) {
        return variables.at(id);
    }
    Scope_id const    scope_id    = scope_for(kind);
    Variable_id const variable_id = m_arena.variables.push(Variable {
        .name  = db::Name { .id = id, .range = range },
        .kind  = kind,
        .scope = scope_id,
    });
    m_arena.scopes[scope_id].variables.insert_or_assign(id, variable_id);
    return variable_id;
}

auto du::ast::Builder::toplevel(std::vector<Node_id> statements, lsp::Range const range) -> Node_id
{
    cpputil::always_assert(m_scopes.size() == 1);
    return push(node::Toplevel { .statements = std::move(statements), .scope = m_scopes.front() }, range);
}

auto du::ast::Builder::module_(db::Name const name, std::vector<Node_id> body, lsp::Range const range)
    -> Node_id
{
    Scope_id const scope = leave_scope(Scope_kind::Module);
    return push(node::Module { .name = name, .body = std::move(body), .scope = scope }, range);
}

auto du::ast::Builder::class_(db::Name const name, std::vector<Node_id> body, lsp::Range const range)
    -> Node_id
{
    Scope_id const scope = leave_scope(Scope_kind::Class);
    return push(node::Class { .name = name, .body = std::move(body), .scope = scope }, range);
}

auto du::ast::Builder::method(
    db::Name const       name,
    std::vector<Node_id> parameters,
    std::vector<Node_id> body,
    lsp::Range const     range) -> Node_id
{
    Scope_id const scope = leave_scope(Scope_kind::Method);
    return push(
        node::Method {
            .name       = name,
            .parameters = std::move(parameters),
            .body       = std::move(body),
            .scope      = scope,
        },
        range);
}

auto du::ast::Builder::block(
    std::vector<Node_id> parameters, std::vector<Node_id> body, lsp::Range const range) -> Node_id
{
    Scope_id const scope = leave_scope(Scope_kind::Block);
    return push(
        node::Block {
            .parameters = std::move(parameters),
            .body       = std::move(body),
            .scope      = scope,
        },
        range);
}

auto du::ast::Builder::sequence(std::vector<Node_id> statements, lsp::Range const range)
    -> Node_id
{
    return push(node::Stmt_sequence { .statements = std::move(statements) }, range);
}

auto du::ast::Builder::parameter(std::string_view const string, lsp::Range const range) -> Node_id
{
    // Parameters always declare a fresh variable, shadowing outer ones.
    utl::String_id const id          = m_pool.make(string);
    Variable_id const    variable_id = m_arena.variables.push(Variable {
           .name  = db::Name { .id = id, .range = range },
           .kind  = Variable_kind::Local,
           .scope = current_scope(),
    });
    m_arena.scopes[current_scope()].variables.insert_or_assign(id, variable_id);
    Node_id const access = push(node::Variable_access { .variable = variable_id }, range);
    return push(node::Simple_parameter { .variable = access }, range);
}

auto du::ast::Builder::identifier_call(db::Name const name, lsp::Range const range) -> Node_id
{
    return push(node::Identifier_call { .name = name }, range);
}

auto du::ast::Builder::method_call(node::Method_call call, lsp::Range const range) -> Node_id
{
    return push(std::move(call), range);
}

auto du::ast::Builder::assignment(Node_id const left, Node_id const right, lsp::Range const range)
    -> Node_id
{
    return push(node::Assignment { .left = left, .right = right }, range);
}

auto du::ast::Builder::assign_operation(
    Binary_operator const op,
    Node_id const         left,
    Node_id const         right,
    lsp::Range const      operator_range,
    lsp::Range const      range) -> Node_id
{
    return push(
        node::Assign_operation {
            .left           = left,
            .right          = right,
            .op             = op,
            .operator_range = operator_range,
        },
        range);
}

auto du::ast::Builder::destructured_lhs(std::vector<Node_id> elements, lsp::Range const range)
    -> Node_id
{
    auto const is_splat = [&](Node_id const id) {
        return std::holds_alternative<node::Splat>(m_arena.nodes[id].variant);
    };
    cpputil::always_assert(std::ranges::count_if(elements, is_splat) <= 1);
    return push(node::Destructured_lhs { .elements = std::move(elements) }, range);
}

auto du::ast::Builder::splat(Node_id const operand, lsp::Range const range) -> Node_id
{
    return push(node::Splat { .operand = operand }, range);
}

auto du::ast::Builder::array_literal(std::vector<Node_id> elements, lsp::Range const range)
    -> Node_id
{
    return push(node::Array_literal { .elements = std::move(elements) }, range);
}

auto du::ast::Builder::for_loop(
    Node_id const pattern, Node_id const iterable, Node_id const body, lsp::Range const range)
    -> Node_id
{
    cpputil::always_assert(
        std::holds_alternative<node::Stmt_sequence>(m_arena.nodes[body].variant));
    return push(
        node::For_loop { .pattern = pattern, .iterable = iterable, .body = body }, range);
}

auto du::ast::Builder::binary(
    Binary_operator const op, Node_id const left, Node_id const right, lsp::Range const range)
    -> Node_id
{
    return push(node::Binary_operation { .left = left, .right = right, .op = op }, range);
}

auto du::ast::Builder::variable(
    std::string_view const string, Variable_kind const kind, lsp::Range const range) -> Node_id
{
    return push(node::Variable_access { .variable = variable_id(string, kind, range) }, range);
}

auto du::ast::Builder::self_access(lsp::Range const range) -> Node_id
{
    return push(node::Self_access {}, range);
}

auto du::ast::Builder::constant(
    std::string_view const string, std::optional<Node_id> const scope, lsp::Range const range)
    -> Node_id
{
    cpputil::always_assert(db::is_constant_name(string));
    return push(node::Constant_access { .name = name(string, range), .scope = scope }, range);
}

auto du::ast::Builder::integer(std::int64_t const value, lsp::Range const range) -> Node_id
{
    return push(db::Integer { .value = value }, range);
}

auto du::ast::Builder::string(std::string_view const string, lsp::Range const range) -> Node_id
{
    return push(db::String { .id = m_pool.make(string) }, range);
}
