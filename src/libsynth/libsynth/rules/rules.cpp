#include <libutl/utilities.hpp>
#include <libsynth/rules.hpp>

auto du::syn::default_rules() -> std::vector<Rule>
{
    return utl::to_vector<Rule>({
        rule::Implicit_self {},
        rule::Setter_assignment {},
        rule::Variable_assign_operation {},
        rule::Setter_assign_operation {},
        rule::Destructured_assignment {},
        rule::Array_literal {},
        rule::For_loop {},
    });
}

auto du::syn::rule_name(Rule const& rule) -> std::string_view
{
    return std::visit([]<typename R>(R const&) { return R::name; }, rule);
}
