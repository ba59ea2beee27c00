#include "ir/constraint/constraint.h"

#include <stdexcept>
#include <utility>

using namespace ir;

Constraint::Constraint(Kind kind, z3::expr assumption, std::shared_ptr<const CallStack> call_stack)
    : _kind(kind), _assumption(std::move(assumption)), _call_stack(std::move(call_stack)) {
    if (!_assumption.is_bool()) {
        throw std::logic_error("Assumption " + _assumption.to_string() + " is not a boolean expression.");
    }
    if (_call_stack == nullptr) {
        throw std::logic_error("Constraint without call stack.");
    }
}
