#include "ir/constraint/expression_constraint.h"

#include <sstream>
#include <stdexcept>
#include <utility>

using namespace ir;

ExpressionConstraint::ExpressionConstraint(z3::expr condition, z3::expr assumption, Origin origin,
                                           std::shared_ptr<const CallStack> call_stack)
    : Constraint(Kind::EXPRESSION, std::move(assumption), std::move(call_stack)), _condition(std::move(condition)),
      _origin(origin) {
    if (!_condition.is_bool()) {
        throw std::logic_error("Condition " + _condition.to_string() + " is not a boolean expression.");
    }
}

const z3::expr &ExpressionConstraint::getCondition() const {
    return _condition;
}

ExpressionConstraint::Origin ExpressionConstraint::getOrigin() const {
    return _origin;
}

std::ostream &ExpressionConstraint::print(std::ostream &os) const {
    std::stringstream str;
    switch (_origin) {
        case Origin::ASSERTED:
            str << "assert ";
            break;
        case Origin::IMPLIED:
            str << "imply ";
            break;
    }
    str << _condition;
    const z3::expr &assumption = getAssumption();
    if (!(assumption.is_app() && assumption.decl().decl_kind() == Z3_decl_kind::Z3_OP_TRUE)) {
        str << " if " << assumption;
    }
    str << " @ " << *getCallStack();
    return os << str.str();
}

ExpressionConstraint *ExpressionConstraint::clone_implementation() const {
    return new ExpressionConstraint(_condition, getAssumption(), _origin, getCallStack());
}

ExpressionConstraint *ExpressionConstraint::substitute_implementation(const sym::Renaming &renaming) const {
    return new ExpressionConstraint(sym::substitute(_condition, renaming), sym::substitute(getAssumption(), renaming),
                                    _origin, getCallStack());
}
