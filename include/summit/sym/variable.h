#ifndef SUMMIT_SYM_VARIABLE_H
#define SUMMIT_SYM_VARIABLE_H

#include "z3++.h"

#include <ostream>
#include <string>

namespace sym {
    /**
 * A symbolic variable, i.e., an uninterpreted constant of the underlying z3 context. Variables of sort Bool are
 * boolean-typed, every other sort is expression-typed.
 */
    class Var {
    public:
        enum class Kind { EXPRESSION, BOOLEAN };

        // XXX default constructor disabled
        Var() = delete;

        explicit Var(z3::expr z3_expression);

        // Returns true, if the expression is an uninterpreted constant, else returns false.
        static bool isVariable(const z3::expr &z3_expression);

        Kind getKind() const;

        std::string getName() const;

        unsigned int getId() const;

        z3::sort getSort() const;

        const z3::expr &getZ3Expression() const;

        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const Var &variable) {
            return variable.print(os);
        }

        friend bool operator==(const Var &lhs, const Var &rhs) {
            return lhs.getId() == rhs.getId();
        }

        friend bool operator!=(const Var &lhs, const Var &rhs) {
            return !(lhs == rhs);
        }

        friend bool operator<(const Var &lhs, const Var &rhs) {
            return lhs.getId() < rhs.getId();
        }

    private:
        z3::expr _z3_expression;
    };
}// namespace sym

#endif//SUMMIT_SYM_VARIABLE_H
