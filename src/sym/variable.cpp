#include "sym/variable.h"

#include <sstream>
#include <stdexcept>
#include <utility>

using namespace sym;

Var::Var(z3::expr z3_expression) : _z3_expression(std::move(z3_expression)) {
    if (!isVariable(_z3_expression)) {
        throw std::logic_error("Expression " + _z3_expression.to_string() + " is not an uninterpreted constant.");
    }
}

bool Var::isVariable(const z3::expr &z3_expression) {
    // XXX Quantifier free formulas do not contain variables in the sense of z3, only constants. An "x" occurring in
    // XXX "x + 1 > 0" is an uninterpreted constant, whereas "1" is an interpreted one.
    return z3_expression.is_app() && z3_expression.num_args() == 0 &&
           z3_expression.decl().decl_kind() == Z3_decl_kind::Z3_OP_UNINTERPRETED;
}

Var::Kind Var::getKind() const {
    return _z3_expression.is_bool() ? Kind::BOOLEAN : Kind::EXPRESSION;
}

std::string Var::getName() const {
    return _z3_expression.decl().name().str();
}

unsigned int Var::getId() const {
    return _z3_expression.id();
}

z3::sort Var::getSort() const {
    return _z3_expression.get_sort();
}

const z3::expr &Var::getZ3Expression() const {
    return _z3_expression;
}

std::ostream &Var::print(std::ostream &os) const {
    std::stringstream str;
    str << getName();
    return os << str.str();
}
