#include "analysis/unresolved_assert_detector.h"
#include "ir/constraint/expression_constraint.h"
#include "utilities/fmt_formatter.h"

#include "spdlog/spdlog.h"

#include <set>

using namespace analysis;

std::vector<Warning>
UnresolvedAssertDetector::detect(const std::vector<std::unique_ptr<ir::Constraint>> &constraints) const {
    auto logger = spdlog::get("Analysis");
    std::map<sym::Var, unsigned int> variable_to_uses = countVariableUses(constraints);

    std::vector<Warning> warnings;
    std::set<ir::SourceLocation> seen_locations;
    for (const std::unique_ptr<ir::Constraint> &constraint : constraints) {
        if (constraint->getKind() != ir::Constraint::Kind::EXPRESSION) {
            continue;
        }
        const auto &expression_constraint = dynamic_cast<const ir::ExpressionConstraint &>(*constraint);
        if (expression_constraint.getOrigin() != ir::ExpressionConstraint::Origin::ASSERTED) {
            continue;
        }
        const z3::expr &condition = expression_constraint.getCondition();
        if (!sym::Var::isVariable(condition)) {
            continue;
        }
        sym::Var variable(condition);
        auto it = variable_to_uses.find(variable);
        if (it == variable_to_uses.end() || it->second != 1) {
            continue;
        }
        const boost::optional<ir::SourceLocation> &location = expression_constraint.getCallStack()->getLocation();
        if (!location.has_value()) {
            SPDLOG_LOGGER_TRACE(logger, "Unresolved assert on {} has no location.", variable);
            continue;
        }
        if (!seen_locations.insert(*location).second) {
            continue;
        }
        SPDLOG_LOGGER_WARN(logger, "{}: {}", *location, MESSAGE);
        warnings.emplace_back(MESSAGE, *location);
    }
    return warnings;
}

std::map<sym::Var, unsigned int>
UnresolvedAssertDetector::countVariableUses(const std::vector<std::unique_ptr<ir::Constraint>> &constraints) {
    std::map<sym::Var, unsigned int> variable_to_uses;
    sym::Renaming count = [&variable_to_uses](const sym::Var &variable) -> boost::optional<z3::expr> {
        ++variable_to_uses[variable];
        return boost::none;
    };
    for (const std::unique_ptr<ir::Constraint> &constraint : constraints) {
        constraint->substitute(count);
    }
    return variable_to_uses;
}
