#include "analysis/solver.h"

#include "spdlog/spdlog.h"

using namespace analysis;

Solver::Solver(z3::context &context) : _context(&context) {}

std::pair<z3::check_result, boost::optional<z3::model>> Solver::check(const z3::expr_vector &expressions) {
    auto logger = spdlog::get("Analysis");

    z3::tactic tactic =
            z3::tactic(*_context, "simplify") & z3::tactic(*_context, "solve-eqs") & z3::tactic(*_context, "smt");
    z3::solver solver = tactic.mk_solver();
    solver.add(expressions);
    z3::check_result check_result = solver.check();
    std::pair<z3::check_result, boost::optional<z3::model>> result(check_result, boost::none);
    switch (check_result) {
        case z3::unsat: {
            SPDLOG_LOGGER_TRACE(logger, "constraint system is unsatisfiable");
            break;
        }
        case z3::sat: {
            z3::model model = solver.get_model();
            result.second = model;
            break;
        }
        case z3::unknown: {
            SPDLOG_LOGGER_WARN(logger, "Solver returned unknown: {}", solver.reason_unknown());
            break;
        }
    }
    return result;
}

std::string Solver::toSmt2(const z3::expr_vector &expressions) {
    z3::solver solver(*_context);
    solver.add(expressions);
    return solver.to_smt2();
}
