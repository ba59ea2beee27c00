#ifndef SUMMIT_ANALYSIS_CONFIGURATION_H
#define SUMMIT_ANALYSIS_CONFIGURATION_H

#include "boost/optional.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace analysis {
    class Configuration {
    public:
        Configuration();

        std::ostream &print(std::ostream &os) const;

        friend std::ostream &operator<<(std::ostream &os, const Configuration &configuration) {
            return configuration.print(os);
        }

    public:
        // entry functions to analyze, every summarized function if unset
        boost::optional<std::vector<std::string>> _entries;
        boost::optional<bool> _warn_unresolved_asserts;
        boost::optional<bool> _check_satisfiability;
        // prefix of the SMT-LIB2 files written per entry function
        boost::optional<std::string> _smt2_prefix;
    };
}// namespace analysis

#endif//SUMMIT_ANALYSIS_CONFIGURATION_H
