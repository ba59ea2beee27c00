#include "analysis/constraint_instantiator.h"
#include "analysis/substitution.h"
#include "ir/constraint/call_constraint.h"
#include "ir/constraint/expression_constraint.h"
#include "sym/expression.h"
#include "utilities/fmt_formatter.h"

#include "spdlog/spdlog.h"

#include <stdexcept>
#include <utility>

using namespace analysis;

namespace {
    // Marks a function as being expanded for the lifetime of the guard, regardless of how the expansion is left.
    class ActiveNameGuard {
    public:
        ActiveNameGuard(std::set<std::string> &active_names, std::string name)
            : _active_names(&active_names), _name(std::move(name)) {
            _active_names->insert(_name);
        }

        ActiveNameGuard(const ActiveNameGuard &other) = delete;
        ActiveNameGuard &operator=(const ActiveNameGuard &) = delete;

        ~ActiveNameGuard() {
            _active_names->erase(_name);
        }

    private:
        std::set<std::string> *const _active_names;
        const std::string _name;
    };
}// namespace

ConstraintInstantiator::ConstraintInstantiator(const std::string &name, const ir::Environment &environment)
    : _environment(&environment), _variable_generator(environment.getContext()) {
    auto logger = spdlog::get("Instantiation");
    const ir::FunctionSummary *function_summary = _environment->findSummary(name);
    if (function_summary == nullptr) {
        SPDLOG_LOGGER_INFO(logger, "No summary for entry function \"{}\", nothing to instantiate.", name);
        return;
    }
    // XXX formals of the root are free symbolic inputs, no caller binds them
    Substitution substitution(_variable_generator);
    std::vector<boost::optional<z3::expr>> arguments =
            sym::substitute(function_summary->getArgumentExpressions(), substitution.getRenaming());
    apply(name, arguments, ir::CallStack::makeTop(), _environment->getContext().bool_val(true));
    SPDLOG_LOGGER_INFO(logger, "Instantiated {} constraints for \"{}\".", _constraints.size(), name);
    SPDLOG_LOGGER_TRACE(logger, "{}", _constraints);
}

const std::vector<std::unique_ptr<ir::Constraint>> &ConstraintInstantiator::getConstraints() const {
    return _constraints;
}

std::vector<std::unique_ptr<ir::Constraint>> ConstraintInstantiator::releaseConstraints() {
    return std::move(_constraints);
}

boost::optional<z3::expr> ConstraintInstantiator::apply(const std::string &name,
                                                        const std::vector<boost::optional<z3::expr>> &arguments,
                                                        const std::shared_ptr<const ir::CallStack> &call_stack,
                                                        const z3::expr &path_condition) {
    auto logger = spdlog::get("Instantiation");
    const ir::FunctionSummary *function_summary = _environment->findSummary(name);
    if (function_summary == nullptr) {
        SPDLOG_LOGGER_TRACE(logger, "Call to \"{}\" at {} is opaque.", name, *call_stack);
        return boost::none;
    }
    if (_active_names.find(name) != _active_names.end()) {
        SPDLOG_LOGGER_TRACE(logger, "Recursive call to \"{}\" at {} is not expanded.", name, *call_stack);
        return boost::none;
    }
    ActiveNameGuard active_name_guard(_active_names, name);

    const std::vector<boost::optional<z3::expr>> &formals = function_summary->getArgumentExpressions();
    if (function_summary->getArity() != arguments.size()) {
        throw std::logic_error("Function \"" + name + "\" expects " + std::to_string(function_summary->getArity()) +
                               " arguments, but " + std::to_string(arguments.size()) + " were supplied.");
    }

    Substitution substitution(_variable_generator);
    sym::Renaming renaming = substitution.getRenaming();

    for (std::vector<boost::optional<z3::expr>>::size_type i = 0; i < formals.size(); ++i) {
        // XXX only arguments constrained on both sides are bound, all others are deliberately left unconstrained
        if (!formals.at(i).has_value() || !arguments.at(i).has_value()) {
            continue;
        }
        z3::expr formal = sym::substitute(*formals.at(i), renaming);
        for (const z3::expr &equality : sym::equal(formal, arguments.at(i))) {
            _constraints.push_back(std::make_unique<ir::ExpressionConstraint>(
                    equality, path_condition, ir::ExpressionConstraint::Origin::IMPLIED, call_stack));
        }
    }

    for (const std::unique_ptr<ir::Constraint> &constraint : function_summary->getConstraints()) {
        std::shared_ptr<const ir::CallStack> frame =
                ir::CallStack::makeFrame(constraint->getCallStack()->getLocation(), call_stack);
        switch (constraint->getKind()) {
            case ir::Constraint::Kind::EXPRESSION: {
                const auto &expression_constraint = dynamic_cast<const ir::ExpressionConstraint &>(*constraint);
                z3::expr condition = sym::substitute(expression_constraint.getCondition(), renaming);
                z3::expr assumption = sym::substitute(expression_constraint.getAssumption(), renaming);
                _constraints.push_back(std::make_unique<ir::ExpressionConstraint>(
                        std::move(condition), sym::conjoin(path_condition, assumption),
                        expression_constraint.getOrigin(), std::move(frame)));
                break;
            }
            case ir::Constraint::Kind::CALL: {
                const auto &call_constraint = dynamic_cast<const ir::CallConstraint &>(*constraint);
                z3::expr full_condition =
                        sym::conjoin(path_condition, sym::substitute(call_constraint.getAssumption(), renaming));
                std::vector<boost::optional<z3::expr>> actual_arguments =
                        sym::substitute(call_constraint.getArguments(), renaming);
                boost::optional<z3::expr> result =
                        apply(call_constraint.getCallee(), actual_arguments, frame, full_condition);
                // XXX an unresolved result leaves later references to the result variable unconstrained
                if (result.has_value() && call_constraint.getResult().has_value()) {
                    z3::expr result_variable = renaming(*call_constraint.getResult()).value();
                    for (const z3::expr &equality : sym::equal(result_variable, result)) {
                        _constraints.push_back(std::make_unique<ir::ExpressionConstraint>(
                                equality, full_condition, ir::ExpressionConstraint::Origin::IMPLIED, frame));
                    }
                }
                break;
            }
            default:
                throw std::logic_error("Unexpected constraint kind encountered.");
        }
    }

    return sym::substitute(function_summary->getReturnExpression(), renaming);
}

std::vector<std::unique_ptr<ir::Constraint>> analysis::instantiate(const std::string &name,
                                                                   const ir::Environment &environment) {
    ConstraintInstantiator constraint_instantiator(name, environment);
    return constraint_instantiator.releaseConstraints();
}
