#include "analysis/analyzer.h"
#include "analysis/constraint_instantiator.h"
#include "analysis/encoder.h"
#include "analysis/solver.h"
#include "analysis/unresolved_assert_detector.h"
#include "utilities/fmt_formatter.h"

#include "spdlog/spdlog.h"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace analysis;

Analyzer::Analyzer(std::unique_ptr<Configuration> configuration, const ir::Environment &environment)
    : _configuration(std::move(configuration)), _environment(&environment) {
    if (_configuration == nullptr) {
        throw std::logic_error("Analyzer requires a configuration.");
    }
}

void Analyzer::run() {
    auto logger = spdlog::get("Analysis");
    std::stringstream str;
    str << *_configuration;
    SPDLOG_LOGGER_INFO(logger, "Configuration:\n{}", str.str());
    if (_configuration->_entries.has_value()) {
        for (const std::string &entry : *_configuration->_entries) {
            analyze(entry);
        }
    } else {
        for (auto it = _environment->namesBegin(); it != _environment->namesEnd(); ++it) {
            analyze(*it);
        }
    }
}

void Analyzer::analyze(const std::string &entry) {
    auto logger = spdlog::get("Analysis");
    if (!_environment->hasSummary(entry)) {
        SPDLOG_LOGGER_WARN(logger, "No summary for entry function \"{}\".", entry);
    }
    std::vector<std::unique_ptr<ir::Constraint>> constraints = instantiate(entry, *_environment);
    SPDLOG_LOGGER_INFO(logger, "Constraints of \"{}\": {}", entry, constraints);

    if (_configuration->_warn_unresolved_asserts.value_or(false)) {
        UnresolvedAssertDetector unresolved_assert_detector;
        _entry_to_warnings[entry] = unresolved_assert_detector.detect(constraints);
    }

    bool check_satisfiability = _configuration->_check_satisfiability.value_or(false);
    if (check_satisfiability || _configuration->_smt2_prefix.has_value()) {
        Encoder encoder(_environment->getContext());
        z3::expr_vector z3_expressions = encoder.encode(constraints);
        Solver solver(_environment->getContext());
        if (check_satisfiability) {
            std::pair<z3::check_result, boost::optional<z3::model>> result = solver.check(z3_expressions);
            _entry_to_check_result.insert_or_assign(entry, result.first);
            if (result.second.has_value()) {
                std::stringstream model;
                model << *result.second;
                SPDLOG_LOGGER_INFO(logger, "Model of \"{}\":\n{}", entry, model.str());
            }
        }
        if (_configuration->_smt2_prefix.has_value()) {
            writeSmt2(entry, solver.toSmt2(z3_expressions));
        }
    }
}

const std::map<std::string, std::vector<Warning>> &Analyzer::getWarnings() const {
    return _entry_to_warnings;
}

const std::map<std::string, z3::check_result> &Analyzer::getCheckResults() const {
    return _entry_to_check_result;
}

void Analyzer::writeSmt2(const std::string &entry, const std::string &smt2) const {
    std::string file_path = *_configuration->_smt2_prefix + entry + ".smt2";
    std::ofstream file(file_path);
    if (!file) {
        throw std::runtime_error("Could not open " + file_path + " for writing.");
    }
    file << smt2;
    file.flush();
    file.close();
}
