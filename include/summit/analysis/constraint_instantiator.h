#ifndef SUMMIT_ANALYSIS_CONSTRAINT_INSTANTIATOR_H
#define SUMMIT_ANALYSIS_CONSTRAINT_INSTANTIATOR_H

#include <gtest/gtest_prod.h>

#include "ir/call_stack.h"
#include "ir/constraint/constraint.h"
#include "ir/environment.h"
#include "sym/variable_generator.h"

#include "boost/optional.hpp"
#include "z3++.h"

#include <memory>
#include <set>
#include <string>
#include <vector>

class TestLibAnalysis_Instantiator_Test;

namespace analysis {
    /**
 * Flattens the call graph reachable from an entry function into a single constraint system. Callees are inlined
 * depth-first in the order their calls occur in a summary, every inlined body is renamed into a namespace of its own
 * and guarded by the path condition of its call. A function that is already being expanded on the current path is
 * treated like an unknown callee, i.e., recursion is unfolded at most once per path.
 *
 * All work is done during construction, an instantiator is meant to be used for a single query.
 */
    class ConstraintInstantiator {
    private:
        FRIEND_TEST(::TestLibAnalysis, Instantiator);

    public:
        // XXX default constructor disabled
        ConstraintInstantiator() = delete;
        // XXX copy constructor disabled
        ConstraintInstantiator(const ConstraintInstantiator &other) = delete;
        // XXX copy assignment disabled
        ConstraintInstantiator &operator=(const ConstraintInstantiator &) = delete;

        ConstraintInstantiator(const std::string &name, const ir::Environment &environment);

        const std::vector<std::unique_ptr<ir::Constraint>> &getConstraints() const;

        std::vector<std::unique_ptr<ir::Constraint>> releaseConstraints();

    private:
        // Instantiates the summary of the callee with the actual arguments and returns its renamed return expression.
        boost::optional<z3::expr> apply(const std::string &name,
                                        const std::vector<boost::optional<z3::expr>> &arguments,
                                        const std::shared_ptr<const ir::CallStack> &call_stack,
                                        const z3::expr &path_condition);

    private:
        const ir::Environment *const _environment;
        sym::VariableGenerator _variable_generator;
        // names of the functions currently being expanded on the path to the constraint being instantiated
        std::set<std::string> _active_names;
        std::vector<std::unique_ptr<ir::Constraint>> _constraints;
    };

    // Flat constraint system of the entry function, empty if the environment has no summary for it.
    std::vector<std::unique_ptr<ir::Constraint>> instantiate(const std::string &name,
                                                             const ir::Environment &environment);
}// namespace analysis

#endif//SUMMIT_ANALYSIS_CONSTRAINT_INSTANTIATOR_H
