#ifndef SUMMIT_SYM_VARIABLE_GENERATOR_H
#define SUMMIT_SYM_VARIABLE_GENERATOR_H

#include <gtest/gtest_prod.h>

#include "sym/variable.h"

#include "z3++.h"

class TestLibSym_VariableGenerator_Test;

namespace sym {
    /**
 * Source of fresh variables for one instantiation session. Every generator starts counting at zero, hence variables of
 * two generators sharing the same z3 context may coincide.
 */
    class VariableGenerator {
    private:
        FRIEND_TEST(::TestLibSym, VariableGenerator);

    public:
        // XXX default constructor disabled
        VariableGenerator() = delete;
        // XXX copy constructor disabled
        VariableGenerator(const VariableGenerator &other) = delete;
        // XXX copy assignment disabled
        VariableGenerator &operator=(const VariableGenerator &) = delete;

        explicit VariableGenerator(z3::context &context);

        Var makeFresh(const z3::sort &sort);

        z3::context &getContext() const;

    private:
        z3::context *const _context;
        unsigned int _counter;
    };
}// namespace sym

#endif//SUMMIT_SYM_VARIABLE_GENERATOR_H
