#include "analysis/encoder.h"
#include "ir/constraint/expression_constraint.h"

#include <stdexcept>

using namespace analysis;

Encoder::Encoder(z3::context &context) : _context(&context) {}

z3::expr Encoder::encode(const ir::Constraint &constraint) const {
    switch (constraint.getKind()) {
        case ir::Constraint::Kind::EXPRESSION: {
            const auto &expression_constraint = dynamic_cast<const ir::ExpressionConstraint &>(constraint);
            const z3::expr &assumption = expression_constraint.getAssumption();
            const z3::expr &condition = expression_constraint.getCondition();
            if (assumption.is_app() && assumption.decl().decl_kind() == Z3_decl_kind::Z3_OP_TRUE) {
                return condition;
            }
            return z3::implies(assumption, condition);
        }
        case ir::Constraint::Kind::CALL:
            throw std::logic_error("Call constraints must be instantiated before they can be encoded.");
        default:
            throw std::logic_error("Unexpected constraint kind encountered.");
    }
}

z3::expr_vector Encoder::encode(const std::vector<std::unique_ptr<ir::Constraint>> &constraints) const {
    z3::expr_vector z3_expressions(*_context);
    for (const std::unique_ptr<ir::Constraint> &constraint : constraints) {
        z3_expressions.push_back(encode(*constraint));
    }
    return z3_expressions;
}
