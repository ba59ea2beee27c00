#ifndef SUMMIT_IR_CONSTRAINT_H
#define SUMMIT_IR_CONSTRAINT_H

#include "ir/call_stack.h"
#include "sym/expression.h"

#include "z3++.h"

#include <memory>
#include <ostream>

namespace ir {
    class Constraint {
    public:
        enum class Kind { EXPRESSION, CALL };

        virtual ~Constraint() = default;

        virtual std::ostream &print(std::ostream &os) const = 0;

        friend std::ostream &operator<<(std::ostream &os, const Constraint &constraint) {
            return constraint.print(os);
        }

        std::unique_ptr<Constraint> clone() const {
            return std::unique_ptr<Constraint>(this->clone_implementation());
        }

        // Applies the renaming to every expression of this constraint, the call stack is kept as is.
        std::unique_ptr<Constraint> substitute(const sym::Renaming &renaming) const {
            return std::unique_ptr<Constraint>(this->substitute_implementation(renaming));
        }

        Kind getKind() const {
            return _kind;
        }

        // The constraint is only required to hold under this assumption.
        const z3::expr &getAssumption() const {
            return _assumption;
        }

        const std::shared_ptr<const CallStack> &getCallStack() const {
            return _call_stack;
        }

    protected:
        Constraint(Kind kind, z3::expr assumption, std::shared_ptr<const CallStack> call_stack);

    private:
        virtual Constraint *clone_implementation() const = 0;
        virtual Constraint *substitute_implementation(const sym::Renaming &renaming) const = 0;

    private:
        const Kind _kind;
        const z3::expr _assumption;
        const std::shared_ptr<const CallStack> _call_stack;
    };
}// namespace ir

#endif//SUMMIT_IR_CONSTRAINT_H
