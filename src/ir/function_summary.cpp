#include "ir/function_summary.h"

#include <iterator>
#include <sstream>
#include <utility>

using namespace ir;

FunctionSummary::FunctionSummary(std::vector<boost::optional<z3::expr>> argument_expressions,
                                 boost::optional<z3::expr> return_expression,
                                 std::vector<std::unique_ptr<Constraint>> constraints)
    : _argument_expressions(std::move(argument_expressions)), _return_expression(std::move(return_expression)),
      _constraints(std::move(constraints)) {}

std::ostream &FunctionSummary::print(std::ostream &os) const {
    std::stringstream str;
    if (!_constraints.empty()) {
        str << "[";
        for (auto it = _constraints.begin(); it != _constraints.end(); ++it) {
            str << **it;
            if (std::next(it) != _constraints.end()) {
                str << ", ";
            }
        }
        str << "] => ";
    }
    str << getSignature();
    return os << str.str();
}

std::string FunctionSummary::prettyPrint() const {
    std::stringstream str;
    if (_constraints.size() <= 4) {
        print(str);
        return str.str();
    }
    str << "[";
    for (auto it = _constraints.begin(); it != _constraints.end(); ++it) {
        str << **it;
        if (std::next(it) != _constraints.end()) {
            str << ",\n ";
        }
    }
    str << "] => " << getSignature();
    return str.str();
}

std::string FunctionSummary::getSignature() const {
    std::stringstream str;
    str << "(";
    for (auto it = _argument_expressions.begin(); it != _argument_expressions.end(); ++it) {
        if (it->has_value()) {
            str << **it;
        } else {
            str << "*";
        }
        if (std::next(it) != _argument_expressions.end()) {
            str << ", ";
        }
    }
    str << ") -> ";
    if (_return_expression.has_value()) {
        str << *_return_expression;
    } else {
        str << "*";
    }
    return str.str();
}

unsigned int FunctionSummary::getArity() const {
    return _argument_expressions.size();
}

const std::vector<boost::optional<z3::expr>> &FunctionSummary::getArgumentExpressions() const {
    return _argument_expressions;
}

const boost::optional<z3::expr> &FunctionSummary::getReturnExpression() const {
    return _return_expression;
}

const std::vector<std::unique_ptr<Constraint>> &FunctionSummary::getConstraints() const {
    return _constraints;
}
