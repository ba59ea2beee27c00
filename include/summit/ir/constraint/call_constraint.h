#ifndef SUMMIT_IR_CALL_CONSTRAINT_H
#define SUMMIT_IR_CALL_CONSTRAINT_H

#include "ir/constraint/constraint.h"
#include "sym/variable.h"

#include "boost/optional.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ir {
    /**
     * Records that the callee was invoked with the given arguments at this point of the body and, if captured, that
     * its result was bound to the result variable. Absent arguments are unconstrained.
     */
    class CallConstraint : public Constraint {
    public:
        CallConstraint(std::string callee, std::vector<boost::optional<z3::expr>> arguments,
                       boost::optional<sym::Var> result, z3::expr assumption,
                       std::shared_ptr<const CallStack> call_stack);

        const std::string &getCallee() const;

        const std::vector<boost::optional<z3::expr>> &getArguments() const;

        const boost::optional<sym::Var> &getResult() const;

        std::unique_ptr<CallConstraint> clone() const {
            return std::unique_ptr<CallConstraint>(static_cast<CallConstraint *>(this->clone_implementation()));
        }

        std::ostream &print(std::ostream &os) const override;

    private:
        CallConstraint *clone_implementation() const override;
        CallConstraint *substitute_implementation(const sym::Renaming &renaming) const override;

    private:
        const std::string _callee;
        const std::vector<boost::optional<z3::expr>> _arguments;
        const boost::optional<sym::Var> _result;
    };
}// namespace ir

#endif//SUMMIT_IR_CALL_CONSTRAINT_H
