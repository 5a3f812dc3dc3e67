#ifndef DULCE_LIBSYNTH_SYNTH
#define DULCE_LIBSYNTH_SYNTH

#include <libutl/utilities.hpp>
#include <libutl/concurrent_map.hpp>
#include <libcompiler/db.hpp>
#include <libsynth/kind.hpp>
#include <libsynth/rules.hpp>
#include <deque>

namespace du::syn {

    // Interns synthetic node addresses. Equal keys always yield the same id.
    class Synth_arena {
        utl::Concurrent_map<Synth_key, Synth_id, Hash_synth_key> m_ids;
        mutable std::mutex                                       m_mutex;
        std::deque<Synth_key>                                    m_keys;
    public:
        auto intern(Synth_key const& key) -> Synth_id;

        // Keys are never removed, so the returned reference remains valid.
        [[nodiscard]] auto key(Synth_id id) const -> Synth_key const&;

        [[nodiscard]] auto contains(Synth_id id) const -> bool;

        [[nodiscard]] auto size() const -> std::size_t;
    };

    // The lexical scope of a node: a real scope or a synthetic block.
    struct Scope : std::variant<ast::Scope_id, Synth_id> {
        using variant::variant;
        auto operator==(Scope const&) const -> bool = default;
    };

    // Every query is safe to call from multiple threads concurrently.
    struct Context {
        db::Database&                                              db;
        std::vector<Rule>                                          rules;
        Kind_registry                                              registry;
        Synth_arena                                                synth;
        utl::Concurrent_map<Slot, std::optional<Child>, Hash_slot> child_cache;
        utl::Concurrent_map<Node, lsp::Range, Hash_node>           location_cache;

        // Collects the demands of every rule over the whole real AST.
        explicit Context(db::Database& db, std::vector<Rule> rules = default_rules());
    };

    // The fact for child `index` of `parent`. Syntactic children take precedence.
    [[nodiscard]] auto child_fact(Context& ctx, Node parent, std::int32_t index)
        -> std::optional<Child>;

    // Child `index` of `parent`. Index -1 is the desugared form of `parent`.
    [[nodiscard]] auto child(Context& ctx, Node parent, std::int32_t index) -> std::optional<Node>;

    // Every child of `node`, in index order.
    [[nodiscard]] auto children(Context& ctx, Node node) -> std::vector<Node>;

    // The synthetic replacement of `node`, if any.
    [[nodiscard]] auto desugared(Context& ctx, Node node) -> std::optional<Node>;

    [[nodiscard]] auto location(Context& ctx, Node node) -> lsp::Range;

    [[nodiscard]] auto is_excluded_from_control_flow(Context& ctx, Node node) -> bool;

    // Synthetic local variables introduced at `node`, with dense slots starting from 0.
    [[nodiscard]] auto declared_variables(Context& ctx, Node node) -> std::vector<Synth_variable>;

    // The scope a synthetic variable belongs to.
    [[nodiscard]] auto variable_scope(Context& ctx, Synth_variable variable) -> Scope;

    // Innermost lexical scope containing `node`.
    [[nodiscard]] auto enclosing_scope(Context& ctx, Node node) -> Scope;

    // Innermost scope that determines the meaning of `self` at `node`.
    [[nodiscard]] auto self_scope(Context& ctx, Node node) -> ast::Scope_id;

    // The structural parent of `node`. For a synthetic node, the node it hangs off.
    [[nodiscard]] auto parent(Context& ctx, Node node) -> std::optional<Node>;

    [[nodiscard]] auto kind_of(Context& ctx, Synth_id node) -> Kind;

    // Number of desugared forms enclosing `node`. A real node reused by a desugared form
    // counts the deepest form it occurs in.
    [[nodiscard]] auto desugar_level(Context& ctx, Node node) -> std::size_t;

    [[nodiscard]] auto is_desugared_root(Context& ctx, Node node) -> bool;

    [[nodiscard]] auto requires_method_call(
        Context& ctx, std::string_view name, bool setter, std::uint32_t arity) -> bool;

    [[nodiscard]] auto requires_constant(Context& ctx, std::string_view name) -> bool;

    // Pre-order of the nodes a control flow graph builder visits from `root`.
    // Desugared nodes are replaced by their desugared forms, excluded nodes are skipped.
    [[nodiscard]] auto evaluation_order(Context& ctx, Node root) -> std::vector<Node>;

    // Check the facts reachable from `roots` and report every defect as an error diagnostic.
    // Returns the number of reported defects.
    auto validate(Context& ctx, std::span<Node const> roots) -> std::size_t;

    // Short human readable description of a node.
    [[nodiscard]] auto describe(Context& ctx, Node node) -> std::string;

} // namespace du::syn

#endif // DULCE_LIBSYNTH_SYNTH
