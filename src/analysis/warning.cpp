#include "analysis/warning.h"

#include <sstream>
#include <utility>

using namespace analysis;

Warning::Warning(std::string message, ir::SourceLocation location)
    : _message(std::move(message)), _location(std::move(location)) {}

const std::string &Warning::getMessage() const {
    return _message;
}

const ir::SourceLocation &Warning::getLocation() const {
    return _location;
}

std::ostream &Warning::print(std::ostream &os) const {
    std::stringstream str;
    str << _location << ": warning: " << _message;
    return os << str.str();
}
