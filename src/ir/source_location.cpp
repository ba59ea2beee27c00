#include "ir/source_location.h"

#include <sstream>
#include <utility>

using namespace ir;

SourceLocation::SourceLocation(std::string file, unsigned int line, unsigned int column)
    : _file(std::move(file)), _line(line), _column(column) {}

const std::string &SourceLocation::getFile() const {
    return _file;
}

unsigned int SourceLocation::getLine() const {
    return _line;
}

unsigned int SourceLocation::getColumn() const {
    return _column;
}

std::ostream &SourceLocation::print(std::ostream &os) const {
    std::stringstream str;
    str << _file << ":" << _line << ":" << _column;
    return os << str.str();
}
