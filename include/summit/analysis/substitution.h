#ifndef SUMMIT_ANALYSIS_SUBSTITUTION_H
#define SUMMIT_ANALYSIS_SUBSTITUTION_H

#include <gtest/gtest_prod.h>

#include "sym/expression.h"
#include "sym/variable.h"
#include "sym/variable_generator.h"

#include "z3++.h"

#include <map>

class TestLibAnalysis_Substitution_Test;

namespace analysis {
    /**
 * Renaming scope of a single call boundary. The first lookup of a variable allocates a fresh variable of the same sort,
 * subsequent lookups of the same variable return the same fresh variable. Fresh variables are never shared between two
 * scopes, even if both rename syntactically identical variables.
 */
    class Substitution {
    private:
        FRIEND_TEST(::TestLibAnalysis, Substitution);

    public:
        // XXX default constructor disabled
        Substitution() = delete;
        // XXX copy constructor disabled
        Substitution(const Substitution &other) = delete;
        // XXX copy assignment disabled
        Substitution &operator=(const Substitution &) = delete;

        explicit Substitution(sym::VariableGenerator &variable_generator);

        z3::expr rename(const sym::Var &variable);

        // The returned renaming refers to this scope and must not outlive it.
        sym::Renaming getRenaming();

    private:
        sym::VariableGenerator *const _variable_generator;
        std::map<sym::Var, sym::Var> _variable_to_fresh_variable;
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_SUBSTITUTION_H
