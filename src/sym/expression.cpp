#include "sym/expression.h"

#include <set>
#include <stdexcept>

namespace {
    bool isTrue(const z3::expr &z3_expression) {
        return z3_expression.is_app() && z3_expression.decl().decl_kind() == Z3_decl_kind::Z3_OP_TRUE;
    }

    void visit(const z3::expr &z3_expression, const sym::Renaming &renaming, std::set<unsigned int> &renamed,
               z3::expr_vector &sources, z3::expr_vector &destinations) {
        if (sym::Var::isVariable(z3_expression)) {
            sym::Var variable(z3_expression);
            boost::optional<z3::expr> z3_destination_expression = renaming(variable);
            if (!z3_destination_expression.has_value()) {
                return;
            }
            if (renamed.find(variable.getId()) != renamed.end()) {
                // XXX a variable can only be substituted by a single expression
                return;
            }
            if (!z3::eq(z3_destination_expression->get_sort(), z3_expression.get_sort())) {
                throw std::logic_error("Renaming of " + variable.getName() + " changes its sort.");
            }
            renamed.insert(variable.getId());
            sources.push_back(z3_expression);
            destinations.push_back(*z3_destination_expression);
        } else if (z3_expression.is_app()) {
            unsigned number_of_arguments = z3_expression.num_args();
            for (unsigned i = 0; i < number_of_arguments; ++i) {
                visit(z3_expression.arg(i), renaming, renamed, sources, destinations);
            }
        } else if (z3_expression.is_quantifier()) {
            visit(z3_expression.body(), renaming, renamed, sources, destinations);
        }
        // XXX bound variables and numerals are left untouched
    }
}// namespace

z3::expr sym::substitute(const z3::expr &z3_expression, const Renaming &renaming) {
    std::set<unsigned int> renamed;
    z3::expr_vector sources(z3_expression.ctx());
    z3::expr_vector destinations(z3_expression.ctx());
    visit(z3_expression, renaming, renamed, sources, destinations);
    if (sources.empty()) {
        return z3_expression;
    }
    z3::expr z3_substituted_expression = z3_expression;
    return z3_substituted_expression.substitute(sources, destinations);
}

boost::optional<z3::expr> sym::substitute(const boost::optional<z3::expr> &z3_expression, const Renaming &renaming) {
    if (!z3_expression.has_value()) {
        return boost::none;
    }
    return substitute(*z3_expression, renaming);
}

std::vector<boost::optional<z3::expr>> sym::substitute(const std::vector<boost::optional<z3::expr>> &z3_expressions,
                                                       const Renaming &renaming) {
    std::vector<boost::optional<z3::expr>> z3_substituted_expressions;
    z3_substituted_expressions.reserve(z3_expressions.size());
    for (const boost::optional<z3::expr> &z3_expression : z3_expressions) {
        z3_substituted_expressions.push_back(substitute(z3_expression, renaming));
    }
    return z3_substituted_expressions;
}

std::vector<z3::expr> sym::equal(const z3::expr &lhs, const boost::optional<z3::expr> &rhs) {
    if (!rhs.has_value()) {
        return {};
    }
    if (!z3::eq(lhs.get_sort(), rhs->get_sort())) {
        throw std::logic_error("Sort mismatch in equality of " + lhs.to_string() + " and " + rhs->to_string() + ".");
    }
    return {lhs == *rhs};
}

z3::expr sym::conjoin(const z3::expr &lhs, const z3::expr &rhs) {
    if (isTrue(lhs)) {
        return rhs;
    }
    if (isTrue(rhs)) {
        return lhs;
    }
    return lhs && rhs;
}
