#ifndef SUMMIT_IR_EXPRESSION_CONSTRAINT_H
#define SUMMIT_IR_EXPRESSION_CONSTRAINT_H

#include "ir/constraint/constraint.h"

#include <memory>

namespace ir {
    /**
     * A standalone fact that must hold whenever its assumption holds. Only constraints stemming from an assertion in
     * the source are tagged as asserted, everything derived by the abstraction or the instantiation is implied.
     */
    class ExpressionConstraint : public Constraint {
    public:
        enum class Origin { ASSERTED, IMPLIED };

        ExpressionConstraint(z3::expr condition, z3::expr assumption, Origin origin,
                             std::shared_ptr<const CallStack> call_stack);

        const z3::expr &getCondition() const;

        Origin getOrigin() const;

        std::unique_ptr<ExpressionConstraint> clone() const {
            return std::unique_ptr<ExpressionConstraint>(
                    static_cast<ExpressionConstraint *>(this->clone_implementation()));
        }

        std::ostream &print(std::ostream &os) const override;

    private:
        ExpressionConstraint *clone_implementation() const override;
        ExpressionConstraint *substitute_implementation(const sym::Renaming &renaming) const override;

    private:
        const z3::expr _condition;
        const Origin _origin;
    };
}// namespace ir

#endif//SUMMIT_IR_EXPRESSION_CONSTRAINT_H
