#include "ir/constraint/call_constraint.h"

#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace ir;

CallConstraint::CallConstraint(std::string callee, std::vector<boost::optional<z3::expr>> arguments,
                               boost::optional<sym::Var> result, z3::expr assumption,
                               std::shared_ptr<const CallStack> call_stack)
    : Constraint(Kind::CALL, std::move(assumption), std::move(call_stack)), _callee(std::move(callee)),
      _arguments(std::move(arguments)), _result(std::move(result)) {}

const std::string &CallConstraint::getCallee() const {
    return _callee;
}

const std::vector<boost::optional<z3::expr>> &CallConstraint::getArguments() const {
    return _arguments;
}

const boost::optional<sym::Var> &CallConstraint::getResult() const {
    return _result;
}

std::ostream &CallConstraint::print(std::ostream &os) const {
    std::stringstream str;
    if (_result.has_value()) {
        str << *_result << " = ";
    }
    str << _callee << "(";
    for (auto it = _arguments.begin(); it != _arguments.end(); ++it) {
        if (it->has_value()) {
            str << **it;
        } else {
            str << "*";
        }
        if (std::next(it) != _arguments.end()) {
            str << ", ";
        }
    }
    str << ")";
    const z3::expr &assumption = getAssumption();
    if (!(assumption.is_app() && assumption.decl().decl_kind() == Z3_decl_kind::Z3_OP_TRUE)) {
        str << " if " << assumption;
    }
    str << " @ " << *getCallStack();
    return os << str.str();
}

CallConstraint *CallConstraint::clone_implementation() const {
    return new CallConstraint(_callee, _arguments, _result, getAssumption(), getCallStack());
}

CallConstraint *CallConstraint::substitute_implementation(const sym::Renaming &renaming) const {
    boost::optional<sym::Var> result;
    if (_result.has_value()) {
        z3::expr z3_result = sym::substitute(_result->getZ3Expression(), renaming);
        if (!sym::Var::isVariable(z3_result)) {
            throw std::logic_error("Result " + _result->getName() + " of call to " + _callee +
                                   " can only be renamed to a variable.");
        }
        result = sym::Var(z3_result);
    }
    return new CallConstraint(_callee, sym::substitute(_arguments, renaming), std::move(result),
                              sym::substitute(getAssumption(), renaming), getCallStack());
}
