#ifndef SUMMIT_SYM_EXPRESSION_H
#define SUMMIT_SYM_EXPRESSION_H

#include "sym/variable.h"

#include "boost/optional.hpp"
#include "z3++.h"

#include <functional>
#include <vector>

namespace sym {
    // A renaming is a partial map from variables to expressions, boost::none leaves the variable untouched.
    using Renaming = std::function<boost::optional<z3::expr>(const Var &)>;

    /**
     * Rewrites every variable occurrence of the given expression for which the renaming is defined. The renaming is
     * invoked once per occurrence, i.e., a variable occurring twice is looked up twice.
     */
    z3::expr substitute(const z3::expr &z3_expression, const Renaming &renaming);

    boost::optional<z3::expr> substitute(const boost::optional<z3::expr> &z3_expression, const Renaming &renaming);

    std::vector<boost::optional<z3::expr>> substitute(const std::vector<boost::optional<z3::expr>> &z3_expressions,
                                                      const Renaming &renaming);

    // Equality constraints between lhs and rhs, empty if rhs is absent.
    std::vector<z3::expr> equal(const z3::expr &lhs, const boost::optional<z3::expr> &rhs);

    // Conjunction of lhs and rhs, a literal true operand yields the other operand.
    z3::expr conjoin(const z3::expr &lhs, const z3::expr &rhs);
}// namespace sym

#endif//SUMMIT_SYM_EXPRESSION_H
