#include <libutl/utilities.hpp>
#include <libsynth/kind.hpp>

using namespace du;
using namespace du::syn;

namespace {
    auto hash_variable(std::variant<ast::Variable_id, Synth_variable> const& variable) -> std::size_t
    {
        auto const visitor = utl::Overload {
            [](ast::Variable_id const id) { return utl::Hash_vector_index {}(id); },
            [](Synth_variable const& synth) {
                std::size_t seed = Hash_node {}(synth.introducer);
                utl::hash_combine(seed, synth.slot);
                return seed;
            },
        };
        std::size_t seed = variable.index();
        utl::hash_combine(seed, std::visit(visitor, variable));
        return seed;
    }

    struct Kind_parameter_hash {
        static auto operator()(kind::Binary const& binary) -> std::size_t
        {
            return std::to_underlying(binary.op);
        }

        static auto operator()(kind::Local_variable_access const& access) -> std::size_t
        {
            return hash_variable(access.variable);
        }

        static auto operator()(utl::one_of< //
                               kind::Instance_variable_access,
                               kind::Class_variable_access,
                               kind::Global_variable_access> auto const& access) -> std::size_t
        {
            return utl::Hash_vector_index {}(access.variable);
        }

        static auto operator()(kind::Self_access const& self) -> std::size_t
        {
            return utl::Hash_vector_index {}(self.self_scope);
        }

        static auto operator()(kind::Integer_literal const& integer) -> std::size_t
        {
            return std::hash<std::int64_t> {}(integer.value);
        }

        static auto operator()(kind::Range_literal const& range) -> std::size_t
        {
            return range.inclusive ? 1 : 0;
        }

        static auto operator()(kind::Method_call const& call) -> std::size_t
        {
            return utl::Hash_vector_index {}(call.id);
        }

        static auto operator()(kind::Constant_read const& constant) -> std::size_t
        {
            return utl::Hash_vector_index {}(constant.name);
        }

        static auto operator()(utl::one_of< //
                               kind::Assign,
                               kind::Brace_block,
                               kind::Stmt_sequence,
                               kind::Simple_parameter,
                               kind::Splat> auto const&) -> std::size_t
        {
            return 0;
        }
    };

    auto signature_string(Method_signature const& signature, utl::String_pool const& pool)
        -> std::string
    {
        return std::format(
            "{} ({}, arity {})",
            pool.get(signature.name),
            signature.setter ? "setter" : "plain",
            signature.arity);
    }
} // namespace

auto du::syn::Hash_node::operator()(Node const& node) const noexcept -> std::size_t
{
    std::size_t seed = node.index();
    utl::hash_combine(seed, std::visit(utl::Hash_vector_index {}, node));
    return seed;
}

auto du::syn::Hash_method_signature::operator()(Method_signature const& signature) const noexcept
    -> std::size_t
{
    std::size_t seed = utl::Hash_vector_index {}(signature.name);
    utl::hash_combine(seed, signature.setter);
    utl::hash_combine(seed, signature.arity);
    return seed;
}

auto du::syn::Hash_kind::operator()(Kind const& kind) const noexcept -> std::size_t
{
    std::size_t seed = kind.index();
    utl::hash_combine(seed, std::visit(Kind_parameter_hash {}, kind));
    return seed;
}

auto du::syn::Hash_slot::operator()(Slot const& slot) const noexcept -> std::size_t
{
    std::size_t seed = Hash_node {}(slot.node);
    utl::hash_combine(seed, slot.index);
    return seed;
}

auto du::syn::Hash_synth_key::operator()(Synth_key const& key) const noexcept -> std::size_t
{
    std::size_t seed = Hash_node {}(key.parent);
    utl::hash_combine(seed, key.index);
    utl::hash_combine(seed, Hash_kind {}(key.kind));
    return seed;
}

auto du::syn::Kind_registry::add_method_call(Method_signature const signature)
    -> Method_call_kind_id
{
    if (auto const existing = find_method_call(signature)) {
        return existing.value();
    }
    Method_call_kind_id const id = m_method_calls.push(signature);
    m_method_call_ids.emplace(signature, id);
    return id;
}

void du::syn::Kind_registry::add_constant(utl::String_id const name)
{
    m_constants.insert(name);
}

auto du::syn::Kind_registry::find_method_call(Method_signature const signature) const
    -> std::optional<Method_call_kind_id>
{
    if (auto const it = m_method_call_ids.find(signature); it != m_method_call_ids.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto du::syn::Kind_registry::method_call(Method_call_kind_id const id) const
    -> Method_signature const&
{
    return m_method_calls[id];
}

auto du::syn::Kind_registry::has_constant(utl::String_id const name) const -> bool
{
    return m_constants.contains(name);
}

auto du::syn::Kind_registry::method_call_count() const noexcept -> std::size_t
{
    return m_method_calls.size();
}

auto du::syn::Kind_registry::constant_count() const noexcept -> std::size_t
{
    return m_constants.size();
}

auto du::syn::is_synthesizable_integer(std::int64_t const value) noexcept -> bool
{
    return integer_literal_min <= value and value <= integer_literal_max;
}

auto du::syn::describe_kind(
    Kind const& kind, Kind_registry const& registry, db::Database const& db) -> std::string
{
    auto const describe_variable = [&](ast::Variable_id const id) {
        ast::Variable const& variable = db.ast.variables[id];
        return std::format(
            "{} {}",
            ast::describe_variable_kind(variable.kind),
            db.string_pool.get(variable.name.id));
    };
    auto const visitor = utl::Overload {
        [](kind::Binary const& binary) {
            return std::format("binary operation {}", ast::binary_operator_string(binary.op));
        },
        [](kind::Assign const&) -> std::string { return "assignment"; },
        [](kind::Brace_block const&) -> std::string { return "brace block"; },
        [&](kind::Local_variable_access const& access) {
            auto const variable_visitor = utl::Overload {
                [&](ast::Variable_id const id) { return describe_variable(id); },
                [](Synth_variable const& variable) {
                    return std::format("temporary {}", variable.slot);
                },
            };
            return std::visit(variable_visitor, access.variable);
        },
        [&](utl::one_of< //
            kind::Instance_variable_access,
            kind::Class_variable_access,
            kind::Global_variable_access> auto const& access) {
            return describe_variable(access.variable);
        },
        [](kind::Self_access const&) -> std::string { return "self"; },
        [](kind::Integer_literal const& integer) {
            return std::format("integer {}", integer.value);
        },
        [](kind::Range_literal const& range) {
            return std::format("{} range", range.inclusive ? "inclusive" : "exclusive");
        },
        [&](kind::Method_call const& call) {
            return std::format(
                "method call {}", signature_string(registry.method_call(call.id), db.string_pool));
        },
        [](kind::Stmt_sequence const&) -> std::string { return "statement sequence"; },
        [](kind::Simple_parameter const&) -> std::string { return "parameter"; },
        [](kind::Splat const&) -> std::string { return "splat"; },
        [&](kind::Constant_read const& constant) {
            return std::format("constant {}", db.string_pool.get(constant.name));
        },
    };
    return std::visit(visitor, kind);
}

auto du::syn::child_ref(Node const node) -> Child
{
    auto const visitor = utl::Overload {
        [](ast::Node_id const id) -> Child { return Real_child_ref { .node = id }; },
        [](Synth_id const id) -> Child { return Synth_child_ref { .node = id }; },
    };
    return std::visit(visitor, node);
}

auto du::syn::as_real(Node const node) -> std::optional<ast::Node_id>
{
    if (auto const* const id = std::get_if<ast::Node_id>(&node)) {
        return *id;
    }
    return std::nullopt;
}

auto du::syn::as_synth(Node const node) -> std::optional<Synth_id>
{
    if (auto const* const id = std::get_if<Synth_id>(&node)) {
        return *id;
    }
    return std::nullopt;
}
