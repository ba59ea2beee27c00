#ifndef SUMMIT_ANALYSIS_SOLVER_H
#define SUMMIT_ANALYSIS_SOLVER_H

#include "boost/optional.hpp"

#include "z3++.h"

#include <string>
#include <utility>

namespace analysis {
    class Solver {
    public:
        // XXX default constructor disabled
        Solver() = delete;
        // XXX copy constructor disabled
        Solver(const Solver &other) = delete;
        // XXX copy assignment disabled
        Solver &operator=(const Solver &) = delete;

        explicit Solver(z3::context &context);

        // Returns a model if the expressions are satisfiable, z3::unknown is passed on to the caller.
        std::pair<z3::check_result, boost::optional<z3::model>> check(const z3::expr_vector &expressions);

        // SMT-LIB2 benchmark asserting all expressions.
        std::string toSmt2(const z3::expr_vector &expressions);

    private:
        z3::context *const _context;
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_SOLVER_H
