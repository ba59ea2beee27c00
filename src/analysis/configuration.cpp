#include "analysis/configuration.h"

#include <iterator>
#include <sstream>

using namespace analysis;

Configuration::Configuration()
    : _entries(boost::none), _warn_unresolved_asserts(true), _check_satisfiability(false), _smt2_prefix(boost::none) {}

std::ostream &Configuration::print(std::ostream &os) const {
    std::stringstream str;
    str << "(\n";
    str << "\tentries: ";
    if (_entries.has_value()) {
        str << "[";
        for (auto it = _entries->begin(); it != _entries->end(); ++it) {
            str << *it;
            if (std::next(it) != _entries->end()) {
                str << ", ";
            }
        }
        str << "]";
    } else {
        str << "all";
    }
    str << ",\n";
    str << "\twarn about unresolved asserts: " << std::boolalpha << _warn_unresolved_asserts.value_or(false) << ",\n";
    str << "\tcheck satisfiability: " << std::boolalpha << _check_satisfiability.value_or(false) << ",\n";
    str << "\tsmt2 prefix: " << (_smt2_prefix.has_value() ? *_smt2_prefix : "none") << "\n";
    str << ")";
    return os << str.str();
}
