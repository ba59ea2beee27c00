#ifndef SUMMIT_IR_FUNCTION_SUMMARY_H
#define SUMMIT_IR_FUNCTION_SUMMARY_H

#include "ir/constraint/constraint.h"

#include "boost/optional.hpp"
#include "z3++.h"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ir {
    /**
 * Abstracted contract of a single function as produced by the abstraction pass: one optional expression per formal
 * argument (boost::none meaning no useful constraint), an optional return expression and the ordered constraints
 * describing the body of the function including its calls.
 */
    class FunctionSummary {
    public:
        // XXX default constructor disabled
        FunctionSummary() = delete;
        // XXX copy constructor disabled
        FunctionSummary(const FunctionSummary &other) = delete;
        // XXX copy assignment disabled
        FunctionSummary &operator=(const FunctionSummary &) = delete;

        FunctionSummary(std::vector<boost::optional<z3::expr>> argument_expressions,
                        boost::optional<z3::expr> return_expression,
                        std::vector<std::unique_ptr<Constraint>> constraints);

        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const FunctionSummary &function_summary) {
            return function_summary.print(os);
        }

        // Like print, but puts every constraint on a line of its own for summaries with more than four constraints.
        std::string prettyPrint() const;

        // "(x, *) -> r", absent expressions are rendered as "*".
        std::string getSignature() const;

        unsigned int getArity() const;

        const std::vector<boost::optional<z3::expr>> &getArgumentExpressions() const;

        const boost::optional<z3::expr> &getReturnExpression() const;

        const std::vector<std::unique_ptr<Constraint>> &getConstraints() const;

    private:
        const std::vector<boost::optional<z3::expr>> _argument_expressions;
        const boost::optional<z3::expr> _return_expression;
        const std::vector<std::unique_ptr<Constraint>> _constraints;
    };
}// namespace ir

#endif//SUMMIT_IR_FUNCTION_SUMMARY_H
