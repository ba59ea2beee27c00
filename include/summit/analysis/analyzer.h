#ifndef SUMMIT_ANALYSIS_ANALYZER_H
#define SUMMIT_ANALYSIS_ANALYZER_H

#include "analysis/configuration.h"
#include "analysis/warning.h"
#include "ir/environment.h"

#include "z3++.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace analysis {
    /**
 * Runs one instantiation query per entry function of an environment and collects the diagnostics of every query.
 */
    class Analyzer {
    public:
        // XXX default constructor disabled
        Analyzer() = delete;
        // XXX copy constructor disabled
        Analyzer(const Analyzer &other) = delete;
        // XXX copy assignment disabled
        Analyzer &operator=(const Analyzer &) = delete;

        Analyzer(std::unique_ptr<Configuration> configuration, const ir::Environment &environment);

        // Analyzes the configured entry functions, or every summarized function if none are configured.
        void run();

        void analyze(const std::string &entry);

        const std::map<std::string, std::vector<Warning>> &getWarnings() const;

        const std::map<std::string, z3::check_result> &getCheckResults() const;

    private:
        void writeSmt2(const std::string &entry, const std::string &smt2) const;

    private:
        const std::unique_ptr<Configuration> _configuration;
        const ir::Environment *const _environment;
        std::map<std::string, std::vector<Warning>> _entry_to_warnings;
        std::map<std::string, z3::check_result> _entry_to_check_result;
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_ANALYZER_H
