#include "ir/environment.h"

#include <sstream>
#include <stdexcept>
#include <utility>

using namespace ir;

Environment::Environment(z3::context &context, summary_map_t name_to_summary)
    : _context(&context), _name_to_summary(std::move(name_to_summary)) {
    for (const auto &name_to_summary_pair : _name_to_summary) {
        if (name_to_summary_pair.second == nullptr) {
            throw std::logic_error("Missing summary for function " + name_to_summary_pair.first + ".");
        }
    }
}

z3::context &Environment::getContext() const {
    return *_context;
}

bool Environment::hasSummary(const std::string &name) const {
    return _name_to_summary.find(name) != _name_to_summary.end();
}

const FunctionSummary *Environment::findSummary(const std::string &name) const {
    auto it = _name_to_summary.find(name);
    if (it == _name_to_summary.end()) {
        return nullptr;
    }
    return it->second.get();
}

const FunctionSummary &Environment::getSummary(const std::string &name) const {
    return *_name_to_summary.at(name);
}

std::size_t Environment::size() const {
    return _name_to_summary.size();
}

std::ostream &Environment::print(std::ostream &os) const {
    std::stringstream str;
    for (const auto &name_to_summary_pair : _name_to_summary) {
        str << name_to_summary_pair.first << ": " << name_to_summary_pair.second->prettyPrint() << "\n";
    }
    return os << str.str();
}

Environment::const_name_it Environment::namesBegin() const {
    return boost::make_transform_iterator(_name_to_summary.begin(), Environment::getName());
}

Environment::const_name_it Environment::namesEnd() const {
    return boost::make_transform_iterator(_name_to_summary.end(), Environment::getName());
}
