#include "analysis/substitution.h"

using namespace analysis;

Substitution::Substitution(sym::VariableGenerator &variable_generator) : _variable_generator(&variable_generator) {}

z3::expr Substitution::rename(const sym::Var &variable) {
    auto it = _variable_to_fresh_variable.find(variable);
    if (it == _variable_to_fresh_variable.end()) {
        it = _variable_to_fresh_variable.emplace(variable, _variable_generator->makeFresh(variable.getSort())).first;
    }
    return it->second.getZ3Expression();
}

sym::Renaming Substitution::getRenaming() {
    return [this](const sym::Var &variable) -> boost::optional<z3::expr> { return rename(variable); };
}
