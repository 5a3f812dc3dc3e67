#include <libutl/utilities.hpp>
#include <libsynth/display.hpp>
#include <libsynth/internals.hpp>

using namespace du;
using namespace du::syn;

namespace {
    struct Display_state {
        std::string output;
        std::string indent;
        bool        unicode {};
        Context&    ctx;
    };

    enum struct Last : std::uint8_t { No, Yes };

    struct Edge {
        std::string label;
        Node        node;
    };

    template <typename... Args>
    auto write_line(Display_state& state, std::format_string<Args...> const fmt, Args&&... args)
    {
        std::format_to(std::back_inserter(state.output), fmt, std::forward<Args>(args)...);
        state.output.push_back('\n');
    }

    void write_node(Display_state& state, Last const last, std::invocable auto const& callback)
    {
        std::size_t const previous_indent = state.indent.size();
        state.output.append(state.indent);
        if (last == Last::Yes) {
            state.output.append(state.unicode ? "└─ " : "+- ");
            state.indent.append("   ");
        }
        else {
            state.output.append(state.unicode ? "├─ " : "|- ");
            state.indent.append(state.unicode ? "│  " : "|  ");
        }
        std::invoke(callback);
        state.indent.resize(previous_indent);
    }

    auto edges(Context& ctx, Node const node) -> std::vector<Edge>
    {
        std::vector<Edge> result;
        if (auto const form = desugared(ctx, node)) {
            result.push_back(Edge { .label = "desugared", .node = form.value() });
        }
        std::size_t const slot_count = as_real(node)
                                           .transform([&](ast::Node_id const id) {
                                               return ast::child_slots(ctx.db.ast, id).size();
                                           })
                                           .value_or(0);
        for (std::int32_t index = 0;; ++index) {
            if (auto const node_child = child(ctx, node, index)) {
                result.push_back(Edge { .label = std::to_string(index), .node = node_child.value() });
            }
            else if (to_size(index) >= slot_count) {
                break;
            }
        }
        return result;
    }

    auto node_line(Context& ctx, Node const node) -> std::string
    {
        std::string line = describe(ctx, node);
        if (is_excluded_from_control_flow(ctx, node)) {
            line.append(" [excluded]");
        }
        if (auto const count = declared_variables(ctx, node).size(); count != 0) {
            std::format_to(std::back_inserter(line), " [declares {}]", count);
        }
        return line;
    }

    void display_edges(Display_state& state, Node const node)
    {
        std::vector<Edge> const node_edges = edges(state.ctx, node);
        for (std::size_t i = 0; i != node_edges.size(); ++i) {
            Edge const& edge = node_edges[i];
            write_node(state, i == node_edges.size() - 1 ? Last::Yes : Last::No, [&] {
                write_line(state, "{}: {}", edge.label, node_line(state.ctx, edge.node));
                display_edges(state, edge.node);
            });
        }
    }

    // Temporaries are numbered in order of first appearance.
    struct Source_state {
        Context&                    ctx;
        std::vector<Synth_variable> temporaries;
    };

    auto render(Source_state& state, Node node) -> std::string;

    auto temporary_name(Source_state& state, Synth_variable const& variable) -> std::string
    {
        auto it = std::ranges::find(state.temporaries, variable);
        if (it == state.temporaries.end()) {
            it = state.temporaries.insert(it, variable);
        }
        return std::format("__synth__{}", std::distance(state.temporaries.begin(), it));
    }

    auto join(Source_state& state, std::span<Node const> const nodes, std::string_view const separator)
        -> std::string
    {
        std::string result;
        for (std::size_t i = 0; i != nodes.size(); ++i) {
            if (i != 0) {
                result.append(separator);
            }
            result.append(render(state, nodes[i]));
        }
        return result;
    }

    auto is_parameter(Context& ctx, Node const node) -> bool
    {
        if (real_as<ast::node::Simple_parameter>(ctx, node) != nullptr) {
            return true;
        }
        return address(ctx, node)
            .transform([](Synth_key const& key) {
                return std::holds_alternative<kind::Simple_parameter>(key.kind);
            })
            .value_or(false);
    }

    auto is_block(Context& ctx, Node const node) -> bool
    {
        if (real_as<ast::node::Block>(ctx, node) != nullptr) {
            return true;
        }
        return address(ctx, node)
            .transform([](Synth_key const& key) {
                return std::holds_alternative<kind::Brace_block>(key.kind);
            })
            .value_or(false);
    }

    auto render_block(Source_state& state, Node const block) -> std::string
    {
        std::vector<Node> parameters;
        std::vector<Node> statements;
        for (Node const node : children(state.ctx, block)) {
            (is_parameter(state.ctx, node) ? parameters : statements).push_back(node);
        }
        if (parameters.empty()) {
            return std::format("{{ {} }}", join(state, statements, "; "));
        }
        return std::format(
            "{{ |{}| {} }}", join(state, parameters, ", "), join(state, statements, "; "));
    }

    auto render_call(
        Source_state&               state,
        std::optional<Node> const   receiver,
        std::string_view const      separator,
        std::string_view const      name,
        std::span<Node const> const arguments,
        std::optional<Node> const   block) -> std::string
    {
        std::string result;
        if (receiver.has_value()) {
            result = std::format("{}{}{}", render(state, receiver.value()), separator, name);
        }
        else {
            result = name;
        }
        if (not arguments.empty()) {
            std::format_to(std::back_inserter(result), "({})", join(state, arguments, ", "));
        }
        if (block.has_value()) {
            std::format_to(std::back_inserter(result), " {}", render_block(state, block.value()));
        }
        return result;
    }

    // A synthetic call: the receiver comes first, a trailing block is rendered as a block.
    auto render_synthetic_call(Source_state& state, Synth_id const node, utl::String_id const name)
        -> std::string
    {
        std::vector<Node> nodes = children(state.ctx, node);
        cpputil::always_assert(not nodes.empty());
        std::optional<Node> block;
        if (nodes.size() > 1 and is_block(state.ctx, nodes.back())) {
            block = nodes.back();
            nodes.pop_back();
        }
        return render_call(
            state,
            nodes.front(),
            ".",
            state.ctx.db.string_pool.get(name),
            std::span(nodes).subspan(1),
            block);
    }

    auto render_binary(Source_state& state, Node const node, std::string_view const op)
        -> std::string
    {
        return std::format(
            "{} {} {}",
            render(state, required_child(state.ctx, node, 0)),
            op,
            render(state, required_child(state.ctx, node, 1)));
    }

    auto render_synthetic(Source_state& state, Synth_id const node) -> std::string
    {
        Context& ctx = state.ctx;

        auto const name = [&](ast::Variable_id const id) -> std::string {
            return std::string(ctx.db.string_pool.get(ctx.db.ast.variables[id].name.id));
        };
        auto const visitor = utl::Overload {
            [&](kind::Binary const& binary) {
                return render_binary(state, node, ast::binary_operator_string(binary.op));
            },
            [&](kind::Assign const&) { return render_binary(state, node, "="); },
            [&](kind::Brace_block const&) { return render_block(state, node); },
            [&](kind::Local_variable_access const& access) {
                auto const variable_visitor = utl::Overload {
                    [&](ast::Variable_id const id) { return name(id); },
                    [&](Synth_variable const& variable) { return temporary_name(state, variable); },
                };
                return std::visit(variable_visitor, access.variable);
            },
            [&](utl::one_of< //
                kind::Instance_variable_access,
                kind::Class_variable_access,
                kind::Global_variable_access> auto const& access) { return name(access.variable); },
            [](kind::Self_access const&) -> std::string { return "self"; },
            [](kind::Integer_literal const& integer) { return std::to_string(integer.value); },
            [&](kind::Range_literal const& range) {
                return std::format(
                    "{}{}{}",
                    render(state, required_child(ctx, node, 0)),
                    range.inclusive ? ".." : "...",
                    render(state, required_child(ctx, node, 1)));
            },
            [&](kind::Method_call const& call) {
                return render_synthetic_call(state, node, ctx.registry.method_call(call.id).name);
            },
            [&](kind::Stmt_sequence const&) { return join(state, children(ctx, node), "; "); },
            [&](kind::Simple_parameter const&) {
                return render(state, required_child(ctx, node, 0));
            },
            [&](kind::Splat const&) {
                return std::format("*{}", render(state, required_child(ctx, node, 0)));
            },
            [&](kind::Constant_read const& constant) {
                return std::string(ctx.db.string_pool.get(constant.name));
            },
        };
        return std::visit(visitor, kind_of(ctx, node));
    }

    auto render_real(Source_state& state, ast::Node_id const id) -> std::string
    {
        Context&                ctx  = state.ctx;
        utl::String_pool const& pool = ctx.db.string_pool;

        auto const nodes = [](std::vector<ast::Node_id> const& ids) {
            return std::ranges::to<std::vector<Node>>(ids);
        };
        auto const scope_body =
            [&](std::string_view const keyword, db::Name const& name, std::vector<ast::Node_id> const& body) {
                if (body.empty()) {
                    return std::format("{} {}; end", keyword, pool.get(name.id));
                }
                return std::format(
                    "{} {}; {}; end", keyword, pool.get(name.id), join(state, nodes(body), "; "));
            };

        auto const visitor = utl::Overload {
            [&](ast::node::Toplevel const& node) {
                return join(state, nodes(node.statements), "; ");
            },
            [&](ast::node::Module const& node) { return scope_body("module", node.name, node.body); },
            [&](ast::node::Class const& node) { return scope_body("class", node.name, node.body); },
            [&](ast::node::Method const& node) {
                return std::format(
                    "def {}({}); {}; end",
                    pool.get(node.name.id),
                    join(state, nodes(node.parameters), ", "),
                    join(state, nodes(node.body), "; "));
            },
            [&](ast::node::Block const&) { return render_block(state, id); },
            [&](ast::node::Stmt_sequence const& node) {
                return join(state, nodes(node.statements), "; ");
            },
            [&](ast::node::Simple_parameter const& node) { return render(state, node.variable); },
            [&](ast::node::Identifier_call const& node) {
                return render_call(
                    state, child(ctx, id, 0), ".", pool.get(node.name.id), {}, std::nullopt);
            },
            [&](ast::node::Method_call const& node) {
                return render_call(
                    state,
                    child(ctx, id, 0),
                    node.scope_qualified ? "::" : ".",
                    pool.get(node.name.id),
                    nodes(node.arguments),
                    node.block.transform([](ast::Node_id const block) { return Node(block); }));
            },
            [&](ast::node::Assignment const&) { return render_binary(state, id, "="); },
            [&](ast::node::Assign_operation const& node) {
                return render_binary(
                    state, id, std::format("{}=", ast::binary_operator_string(node.op)));
            },
            [&](ast::node::Destructured_lhs const& node) {
                return join(state, nodes(node.elements), ", ");
            },
            [&](ast::node::Splat const& node) {
                return std::format("*{}", render(state, node.operand));
            },
            [&](ast::node::Array_literal const& node) {
                return std::format("[{}]", join(state, nodes(node.elements), ", "));
            },
            [&](ast::node::For_loop const& node) {
                return std::format(
                    "for {} in {}; {}; end",
                    render(state, node.pattern),
                    render(state, node.iterable),
                    render(state, node.body));
            },
            [&](ast::node::Binary_operation const& node) {
                return render_binary(state, id, ast::binary_operator_string(node.op));
            },
            [&](ast::node::Variable_access const& node) {
                return std::string(pool.get(ctx.db.ast.variables[node.variable].name.id));
            },
            [](ast::node::Self_access const&) -> std::string { return "self"; },
            [&](ast::node::Constant_access const& node) {
                if (node.scope.has_value()) {
                    return std::format(
                        "{}::{}", render(state, node.scope.value()), pool.get(node.name.id));
                }
                return std::string(pool.get(node.name.id));
            },
            [](db::Integer const& integer) { return std::to_string(integer.value); },
            [&](db::String const& string) { return std::format("{:?}", pool.get(string.id)); },
        };
        return std::visit(visitor, ctx.db.ast.nodes[id].variant);
    }

    auto render(Source_state& state, Node const node) -> std::string
    {
        if (auto const form = desugared(state.ctx, node)) {
            return render(state, form.value());
        }
        auto const visitor = utl::Overload {
            [&](ast::Node_id const id) { return render_real(state, id); },
            [&](Synth_id const id) { return render_synthetic(state, id); },
        };
        return std::visit(visitor, node);
    }
} // namespace

auto du::syn::display(Context& ctx, Node const root, Display_options const options) -> std::string
{
    Display_state state { .output = {}, .indent = {}, .unicode = options.unicode, .ctx = ctx };
    write_line(state, "{}", node_line(ctx, root));
    display_edges(state, root);
    return std::move(state.output);
}

auto du::syn::to_source(Context& ctx, Node const node) -> std::string
{
    Source_state state { .ctx = ctx, .temporaries = {} };
    return render(state, node);
}
